#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "RuleOf5.h"
#include "Signal2.h"
#include "macros.h"

#include <functional>

class NODISCARD ChangeMonitor final
{
public:
    using Function = std::function<void()>;
    using Lifetime = Signal2Lifetime;

private:
    Signal2<> m_sig;

public:
    ChangeMonitor() = default;
    ~ChangeMonitor() = default;
    DELETE_CTORS_AND_ASSIGN_OPS(ChangeMonitor);

public:
    void registerChangeCallback(const Lifetime &lifetime, const Function &callback)
    {
        m_sig.connect(lifetime, callback);
    }
    void notifyAll() { m_sig.invoke(); }
};
