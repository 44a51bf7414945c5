#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#define DEFAULT_COPY_CTOR(T) T(const T &) = default
#define DEFAULT_MOVE_CTOR(T) T(T &&) = default
#define DEFAULT_COPY_ASSIGN_OP(T) T &operator=(const T &) = default
#define DEFAULT_MOVE_ASSIGN_OP(T) T &operator=(T &&) = default

#define DELETE_COPY_CTOR(T) T(const T &) = delete
#define DELETE_MOVE_CTOR(T) T(T &&) = delete
#define DELETE_COPY_ASSIGN_OP(T) T &operator=(const T &) = delete
#define DELETE_MOVE_ASSIGN_OP(T) T &operator=(T &&) = delete

#define DEFAULT_COPIES(T) \
    DEFAULT_COPY_CTOR(T); \
    DEFAULT_COPY_ASSIGN_OP(T)
#define DEFAULT_MOVES(T) \
    DEFAULT_MOVE_CTOR(T); \
    DEFAULT_MOVE_ASSIGN_OP(T)
#define DELETE_COPIES(T) \
    DELETE_COPY_CTOR(T); \
    DELETE_COPY_ASSIGN_OP(T)
#define DELETE_MOVES(T) \
    DELETE_MOVE_CTOR(T); \
    DELETE_MOVE_ASSIGN_OP(T)

#define DEFAULT_CTORS_AND_ASSIGN_OPS(T) \
    DEFAULT_COPIES(T); \
    DEFAULT_MOVES(T)
#define DELETE_CTORS_AND_ASSIGN_OPS(T) \
    DELETE_COPIES(T); \
    DELETE_MOVES(T)
#define DEFAULT_MOVES_DELETE_COPIES(T) \
    DEFAULT_MOVES(T); \
    DELETE_COPIES(T)
