#pragma once

/// Main header for the RESP3 value model and its derived operations.

#include <respkit/resp3/kind.hpp>
#include <respkit/resp3/value.hpp>
#include <respkit/resp3/message.hpp>
#include <respkit/resp3/visitor.hpp>
#include <respkit/resp3/length.hpp>
#include <respkit/resp3/equal.hpp>
#include <respkit/resp3/hash.hpp>
