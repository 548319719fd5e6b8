#pragma once

// This is the primary include file of the logmux device log aggregation
// library. LogAggregator (via LogReaderRegistry) is the entry point; the
// other headers expose its building blocks.
#include "logmux/capture_process.hpp"
#include "logmux/config.hpp"
#include "logmux/line_deduplicator.hpp"
#include "logmux/line_source.hpp"
#include "logmux/log_aggregator.hpp"
#include "logmux/log_reader_registry.hpp"
#include "logmux/logmux_common_types.hpp"
#include "logmux/multiline_reassembler.hpp"
#include "logmux/source_classifier.hpp"
#include "logmux/vis_decoder.hpp"
