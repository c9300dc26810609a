#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace fincalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

} // anonymous namespace

bool ParquetWriter::available() {
    return true;
}

void ParquetWriter::write_experiment(const ExperimentResult& result, const std::string& filepath) {
    if (result.rows.empty()) {
        throw std::runtime_error("ExperimentResult has no rows to write");
    }

    auto schema = arrow::schema({
        arrow::field("num_debts", arrow::uint64()),
        arrow::field("total_principal", arrow::float64()),
        arrow::field("budget", arrow::float64()),
        arrow::field("runtime_ms", arrow::float64()),
        arrow::field("periods_elapsed", arrow::int32()),
        arrow::field("total_interest_paid", arrow::float64()),
        arrow::field("status", arrow::utf8())
    });

    arrow::UInt64Builder num_debts_builder;
    arrow::DoubleBuilder principal_builder;
    arrow::DoubleBuilder budget_builder;
    arrow::DoubleBuilder runtime_builder;
    arrow::Int32Builder periods_builder;
    arrow::DoubleBuilder interest_builder;
    arrow::StringBuilder status_builder;

    const int64_t n = static_cast<int64_t>(result.rows.size());
    check(num_debts_builder.Reserve(n), "reserve num_debts column");
    check(principal_builder.Reserve(n), "reserve total_principal column");
    check(budget_builder.Reserve(n), "reserve budget column");
    check(runtime_builder.Reserve(n), "reserve runtime_ms column");
    check(periods_builder.Reserve(n), "reserve periods_elapsed column");
    check(interest_builder.Reserve(n), "reserve total_interest_paid column");

    for (const ExperimentRow& row : result.rows) {
        check(num_debts_builder.Append(static_cast<uint64_t>(row.num_debts)), "append num_debts");
        check(principal_builder.Append(row.total_principal), "append total_principal");
        check(budget_builder.Append(row.budget), "append budget");
        check(runtime_builder.Append(row.runtime_ms), "append runtime_ms");
        check(periods_builder.Append(row.periods_elapsed), "append periods_elapsed");
        check(interest_builder.Append(row.total_interest_paid), "append total_interest_paid");
        check(status_builder.Append(status_to_string(row.status)), "append status");
    }

    std::shared_ptr<arrow::Array> num_debts_array;
    std::shared_ptr<arrow::Array> principal_array;
    std::shared_ptr<arrow::Array> budget_array;
    std::shared_ptr<arrow::Array> runtime_array;
    std::shared_ptr<arrow::Array> periods_array;
    std::shared_ptr<arrow::Array> interest_array;
    std::shared_ptr<arrow::Array> status_array;
    check(num_debts_builder.Finish(&num_debts_array), "finish num_debts array");
    check(principal_builder.Finish(&principal_array), "finish total_principal array");
    check(budget_builder.Finish(&budget_array), "finish budget array");
    check(runtime_builder.Finish(&runtime_array), "finish runtime_ms array");
    check(periods_builder.Finish(&periods_array), "finish periods_elapsed array");
    check(interest_builder.Finish(&interest_array), "finish total_interest_paid array");
    check(status_builder.Finish(&status_array), "finish status array");

    auto table = arrow::Table::Make(schema, {
        num_debts_array, principal_array, budget_array, runtime_array,
        periods_array, interest_array, status_array
    });

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

#else // !HAVE_ARROW

bool ParquetWriter::available() {
    return false;
}

void ParquetWriter::write_experiment(const ExperimentResult& /* result */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace fincalc
