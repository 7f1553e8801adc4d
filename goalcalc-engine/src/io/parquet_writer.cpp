#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace goalcalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

} // anonymous namespace

void ParquetWriter::write_distribution(const SimulationResult& result, const std::string& filepath) {
    const auto& values = result.terminal_values;
    if (values.empty()) {
        throw std::runtime_error(
            "SimulationResult has no terminal values to write. Set SuccessConfig.store_terminal_values.");
    }

    auto schema = arrow::schema({
        arrow::field("path_id", arrow::uint32()),
        arrow::field("terminal_value", arrow::float64()),
        arrow::field("met_target", arrow::boolean())
    });

    arrow::UInt32Builder path_id_builder;
    arrow::DoubleBuilder value_builder;
    arrow::BooleanBuilder met_builder;

    check(path_id_builder.Reserve(values.size()), "Failed to reserve path_id column");
    check(value_builder.Reserve(values.size()), "Failed to reserve terminal_value column");
    check(met_builder.Reserve(values.size()), "Failed to reserve met_target column");

    for (size_t i = 0; i < values.size(); ++i) {
        check(path_id_builder.Append(static_cast<uint32_t>(i)), "Failed to append path_id");
        check(value_builder.Append(values[i]), "Failed to append terminal_value");
        check(met_builder.Append(values[i] >= result.target_amount), "Failed to append met_target");
    }

    std::shared_ptr<arrow::Array> path_id_array;
    check(path_id_builder.Finish(&path_id_array), "Failed to finish path_id array");
    std::shared_ptr<arrow::Array> value_array;
    check(value_builder.Finish(&value_array), "Failed to finish terminal_value array");
    std::shared_ptr<arrow::Array> met_array;
    check(met_builder.Finish(&met_array), "Failed to finish met_target array");

    auto table = arrow::Table::Make(schema, {path_id_array, value_array, met_array});

    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "Failed to write Parquet table");
    check(outfile->Close(), "Failed to close Parquet file");
}

#else // !HAVE_ARROW

void ParquetWriter::write_distribution(const SimulationResult& /* result */,
                                       const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace goalcalc
