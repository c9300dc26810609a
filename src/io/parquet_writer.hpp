#ifndef FINCALC_PARQUET_WRITER_HPP
#define FINCALC_PARQUET_WRITER_HPP

#include "../experiment.hpp"
#include <string>

namespace fincalc {

class ParquetWriter {
public:
    /**
     * Write experiment rows to a Parquet file.
     *
     * Output schema:
     *   - num_debts: uint64
     *   - total_principal: float64
     *   - budget: float64
     *   - runtime_ms: float64
     *   - periods_elapsed: int32
     *   - total_interest_paid: float64
     *   - status: utf8
     *
     * @param result ExperimentResult to write
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the result is empty, the file cannot be
     *         written, or the build has no Arrow support
     */
    static void write_experiment(const ExperimentResult& result, const std::string& filepath);

    // True when built with Apache Arrow
    static bool available();
};

} // namespace fincalc

#endif // FINCALC_PARQUET_WRITER_HPP
