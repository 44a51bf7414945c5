#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "RuleOf5.h"
#include "macros.h"

#include <functional>
#include <memory>
#include <utility>
#include <vector>

/// Owner-side token; connections made with it die when it is destroyed.
class NODISCARD Signal2Lifetime final
{
public:
    struct NODISCARD Obj final
    {};

private:
    std::shared_ptr<Obj> m_obj = std::make_shared<Obj>();

public:
    Signal2Lifetime() = default;
    ~Signal2Lifetime() = default;
    DELETE_CTORS_AND_ASSIGN_OPS(Signal2Lifetime);

public:
    NODISCARD std::weak_ptr<Obj> getObj() const { return m_obj; }
    void disconnectAll() { m_obj = std::make_shared<Obj>(); }
};

/// Single-threaded signal; callbacks are skipped (and pruned) once their lifetime expires.
template<typename... Args>
class NODISCARD Signal2 final
{
public:
    using Function = std::function<void(Args...)>;

private:
    struct NODISCARD Entry final
    {
        std::weak_ptr<Signal2Lifetime::Obj> lifetime;
        Function callback;
    };
    std::vector<Entry> m_callbacks;

public:
    Signal2() = default;
    ~Signal2() = default;
    DELETE_CTORS_AND_ASSIGN_OPS(Signal2);

public:
    void connect(const Signal2Lifetime &lifetime, Function callback)
    {
        m_callbacks.push_back(Entry{lifetime.getObj(), std::move(callback)});
    }

    void invoke(Args... args)
    {
        // Copy so that a callback may connect new listeners while we iterate.
        const auto copy = m_callbacks;
        for (const Entry &e : copy) {
            if (auto alive = e.lifetime.lock()) {
                e.callback(args...);
            }
        }
        prune();
    }

    NODISCARD size_t getNumListeners() const
    {
        size_t count = 0;
        for (const Entry &e : m_callbacks) {
            if (!e.lifetime.expired()) {
                ++count;
            }
        }
        return count;
    }

private:
    void prune()
    {
        auto it = m_callbacks.begin();
        while (it != m_callbacks.end()) {
            if (it->lifetime.expired()) {
                it = m_callbacks.erase(it);
            } else {
                ++it;
            }
        }
    }
};
