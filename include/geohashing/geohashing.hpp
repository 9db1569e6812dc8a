#pragma once

/// Convenience umbrella header for the geohashing library.

#include <geohashing/core/coordinate.hpp>
#include <geohashing/core/date.hpp>
#include <geohashing/core/error.hpp>
#include <geohashing/engine/engine.hpp>
#include <geohashing/fetch/index_fetcher.hpp>
#include <geohashing/hash/centicule.hpp>
#include <geohashing/hash/compliance.hpp>
#include <geohashing/hash/decoder.hpp>
#include <geohashing/hash/digest.hpp>
