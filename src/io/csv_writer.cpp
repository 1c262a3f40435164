/**
 * @file csv_writer.cpp
 * @brief CSV aggregate outputs
 */

#include "sensorflow/io/csv_writer.hpp"

#include <iomanip>
#include <limits>

#include "sensorflow/core/errors.hpp"

namespace sensorflow {

namespace {

std::unique_ptr<std::ofstream> create(const std::string& path) {
    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::trunc);
    if (!*file) {
        throw OutputError("Cannot create output file: " + path);
    }
    return file;
}

void write_header(std::ostream& out, const char* header) {
    out << header << '\n';
    out.flush();
    if (!out) {
        throw OutputError(std::string("Failed to write CSV header: ") + header);
    }
}

void check(std::ostream& out, const char* what) {
    out.flush();
    if (!out) {
        throw OutputError(std::string("Failed to write ") + what + " row");
    }
}

} // namespace

CsvAverageWriter::CsvAverageWriter(const std::string& path)
    : owned_(create(path))
    , out_(*owned_) {
    out_ << std::setprecision(std::numeric_limits<double>::digits10);
    write_header(out_, "Bin Start,Bin End,Average Value");
}

CsvAverageWriter::CsvAverageWriter(std::ostream& out)
    : out_(out) {
    out_ << std::setprecision(std::numeric_limits<double>::digits10);
    write_header(out_, "Bin Start,Bin End,Average Value");
}

void CsvAverageWriter::write(const Average& average) {
    out_ << average.start << ',' << average.end << ',' << average.value << '\n';
    check(out_, "average");
    rows_++;
}

CsvCentroidWriter::CsvCentroidWriter(const std::string& path)
    : owned_(create(path))
    , out_(*owned_) {
    out_ << std::setprecision(std::numeric_limits<double>::digits10);
    write_header(out_, "x,y");
}

CsvCentroidWriter::CsvCentroidWriter(std::ostream& out)
    : out_(out) {
    out_ << std::setprecision(std::numeric_limits<double>::digits10);
    write_header(out_, "x,y");
}

void CsvCentroidWriter::write(const Centroid& centroid) {
    out_ << centroid.x << ',' << centroid.y << '\n';
    check(out_, "centroid");
}

} // namespace sensorflow
