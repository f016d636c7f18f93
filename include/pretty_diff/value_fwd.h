// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for the type and value model
///
/// Lets headers declare functions over Value / ValueRef / Type without
/// pulling in immer through value.h.

#pragma once

#include <cstdint>

namespace pretty_diff {

enum class Kind : std::uint8_t;

class Type;
class TypeRegistry;

struct Value;
class ValueRef;
struct MapEntryRef;

class Printer;

} // namespace pretty_diff
