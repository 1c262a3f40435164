#pragma once

/**
 * @file csv_writer.hpp
 * @brief CSV outputs for finalized aggregates
 */

#include <fstream>
#include <memory>
#include <ostream>
#include <string>

#include "sensorflow/sinks/spatial_averager.hpp"
#include "sensorflow/sinks/windowed_averager.hpp"

namespace sensorflow {

/**
 * @brief Writes `Bin Start,Bin End,Average Value` rows
 *
 * The header goes out on construction. Every row is flushed so a crashed
 * run still leaves the averages finalized so far.
 */
class CsvAverageWriter : public AverageWriter {
public:
    /**
     * @throws OutputError if the file cannot be created
     */
    explicit CsvAverageWriter(const std::string& path);

    /**
     * @brief Write to a caller-owned stream
     */
    explicit CsvAverageWriter(std::ostream& out);

    void write(const Average& average) override;

    [[nodiscard]] std::uint64_t rows_written() const noexcept { return rows_; }

private:
    std::unique_ptr<std::ofstream> owned_;
    std::ostream& out_;
    std::uint64_t rows_{0};
};

/**
 * @brief Writes `x,y` rows
 */
class CsvCentroidWriter : public CentroidWriter {
public:
    /**
     * @throws OutputError if the file cannot be created
     */
    explicit CsvCentroidWriter(const std::string& path);

    explicit CsvCentroidWriter(std::ostream& out);

    void write(const Centroid& centroid) override;

private:
    std::unique_ptr<std::ofstream> owned_;
    std::ostream& out_;
};

} // namespace sensorflow
