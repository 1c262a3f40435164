#pragma once

/**
 * @file sensorflow.hpp
 * @brief Main header for sensorflow - sensor event pipeline and windowed aggregation
 *
 * Include this single header to access the full sensorflow API.
 */

#include "sensorflow/core/clock.hpp"
#include "sensorflow/core/errors.hpp"
#include "sensorflow/core/event.hpp"
#include "sensorflow/core/logging.hpp"
#include "sensorflow/core/metrics.hpp"
#include "sensorflow/core/pipeline.hpp"
#include "sensorflow/core/queue.hpp"
#include "sensorflow/core/sink.hpp"
#include "sensorflow/core/stage.hpp"
#include "sensorflow/core/stream.hpp"

#include "sensorflow/stages/bounded_duration.hpp"
#include "sensorflow/stages/deduplication.hpp"
#include "sensorflow/stages/location_filter.hpp"

#include "sensorflow/sinks/spatial_averager.hpp"
#include "sensorflow/sinks/windowed_averager.hpp"

#include "sensorflow/io/config.hpp"
#include "sensorflow/io/csv_writer.hpp"
#include "sensorflow/io/locations.hpp"
#include "sensorflow/io/sources.hpp"

#include "sensorflow/monitor.hpp"

namespace sensorflow {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace sensorflow
