#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace plantval {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " array");
    return array;
}

void write_table(const std::shared_ptr<arrow::Table>& table, const std::string& filepath) {
    auto outfile_result = arrow::io::FileOutputStream::Open(filepath);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 outfile_result.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *outfile_result;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

} // anonymous namespace

void ParquetWriter::write_cash_flows(const ValuationResult& result, const std::string& filepath) {
    if (result.cash_flows.empty()) {
        throw std::runtime_error("ValuationResult has no cash flows to write.");
    }

    auto schema = arrow::schema({
        arrow::field("year", arrow::int32()),
        arrow::field("net_cash_flow", arrow::float64())
    });

    arrow::Int32Builder year_builder;
    arrow::DoubleBuilder cf_builder;

    check(year_builder.Reserve(result.cash_flows.size()), "reserve year column");
    check(cf_builder.Reserve(result.cash_flows.size()), "reserve net_cash_flow column");

    for (size_t i = 0; i < result.cash_flows.size(); ++i) {
        check(year_builder.Append(static_cast<int32_t>(i + 1)), "append year");
        check(cf_builder.Append(result.cash_flows[i]), "append net_cash_flow");
    }

    auto table = arrow::Table::Make(schema, {
        finish(year_builder, "year"),
        finish(cf_builder, "net_cash_flow")
    });

    write_table(table, filepath);
}

void ParquetWriter::write_scenarios(const ScenarioResultSet& results, const std::string& filepath) {
    if (results.empty()) {
        throw std::runtime_error("ScenarioResultSet has no scenario results to write.");
    }

    auto schema = arrow::schema({
        arrow::field("scenario", arrow::utf8()),
        arrow::field("utilisation_rate", arrow::float64()),
        arrow::field("adjusted_present_value", arrow::float64()),
        arrow::field("option_value", arrow::float64()),
        arrow::field("npv", arrow::float64())
    });

    arrow::StringBuilder name_builder;
    arrow::DoubleBuilder rate_builder;
    arrow::DoubleBuilder pv_builder;
    arrow::DoubleBuilder option_builder;
    arrow::DoubleBuilder npv_builder;

    for (const auto& result : results) {
        check(name_builder.Append(result.scenario_name), "append scenario");
        check(rate_builder.Append(result.utilisation_rate), "append utilisation_rate");
        check(pv_builder.Append(result.adjusted_present_value), "append adjusted_present_value");
        check(option_builder.Append(result.option_value), "append option_value");
        check(npv_builder.Append(result.npv()), "append npv");
    }

    auto table = arrow::Table::Make(schema, {
        finish(name_builder, "scenario"),
        finish(rate_builder, "utilisation_rate"),
        finish(pv_builder, "adjusted_present_value"),
        finish(option_builder, "option_value"),
        finish(npv_builder, "npv")
    });

    write_table(table, filepath);
}

#else // !HAVE_ARROW

void ParquetWriter::write_cash_flows(const ValuationResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

void ParquetWriter::write_scenarios(const ScenarioResultSet& /* results */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace plantval
