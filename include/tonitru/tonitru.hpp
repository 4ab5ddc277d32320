#pragma once

/// @file tonitru.hpp
/// @brief Umbrella header for the Tonitru HTLV decode library

// Platform
#include "tonitru/platform/platform.hpp"

// Types
#include "tonitru/types/error.hpp"
#include "tonitru/types/wire_type.hpp"
#include "tonitru/types/record_header.hpp"
#include "tonitru/types/value.hpp"

// SIMD dispatch
#include "tonitru/simd/capability.hpp"
#include "tonitru/simd/kernels.hpp"
#include "tonitru/simd/dispatch.hpp"

// Memory
#include "tonitru/memory/wait_strategy.hpp"
#include "tonitru/memory/mpmc_queue.hpp"
#include "tonitru/memory/batch_buffer.hpp"

// Codec
#include "tonitru/codec/varint.hpp"
#include "tonitru/codec/fragment_chain.hpp"
#include "tonitru/codec/decoder.hpp"
#include "tonitru/codec/encoder.hpp"

// Pipeline
#include "tonitru/pipeline/config.hpp"
#include "tonitru/pipeline/batch_result.hpp"
#include "tonitru/pipeline/stats.hpp"
#include "tonitru/pipeline/pipeline.hpp"

// Utilities
#include "tonitru/util/logger.hpp"
