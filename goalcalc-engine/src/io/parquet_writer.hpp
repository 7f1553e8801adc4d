#ifndef GOALCALC_PARQUET_WRITER_HPP
#define GOALCALC_PARQUET_WRITER_HPP

#include "../success_probability.hpp"
#include <string>

namespace goalcalc {

class ParquetWriter {
public:
    /**
     * Write the terminal-value distribution of a simulation to a Parquet file.
     *
     * Output schema:
     *   - path_id: uint32 (0-indexed)
     *   - terminal_value: float64
     *   - met_target: bool (terminal_value >= target_amount)
     *
     * @param result SimulationResult with stored terminal values
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if there is no distribution, the file cannot
     *         be written, or the build has no Arrow support
     */
    static void write_distribution(const SimulationResult& result, const std::string& filepath);
};

} // namespace goalcalc

#endif // GOALCALC_PARQUET_WRITER_HPP
