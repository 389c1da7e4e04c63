#pragma once

// Out-of-line definitions. Include from exactly one translation unit.

#include <respkit/impl/assert.ipp>
#include <respkit/impl/error.ipp>
#include <respkit/resp3/impl/equal.ipp>
#include <respkit/resp3/impl/hash.ipp>
#include <respkit/resp3/impl/length.ipp>
#include <respkit/resp3/impl/map.ipp>
