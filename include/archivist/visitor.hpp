/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once

namespace archivist {

template <typename... Args> struct visitor : public Args... {
    visitor(Args... args) : Args{args}... {}

    using Args::operator()...;
};

}
