#ifndef SCAN_RESULTS_CSV_WRITER_HPP
#define SCAN_RESULTS_CSV_WRITER_HPP

#include "scanner/data_structures/data_structures.hpp"
#include <fstream>
#include <string>
#include <mutex>

namespace CanslimScanner {
namespace Logging {

enum class ExportKind {
    RANKED_RESULTS,
    ENTRY_SIGNALS
};

/**
 * CSV export of a scan report.
 * RANKED_RESULTS writes one row per accepted symbol in rank order;
 * ENTRY_SIGNALS writes one row per entry signal of the accepted symbols.
 */
class ScanResultsCsvWriter {
private:
    std::string file_path;
    ExportKind export_kind;
    std::ofstream file_stream;
    std::mutex file_mutex;
    bool initialized = false;

    void write_header();
    void ensure_initialized();

public:
    // Creates the parent directory and writes the header. Throws std::runtime_error when the file cannot be opened.
    ScanResultsCsvWriter(const std::string& export_file_path, ExportKind kind);
    ~ScanResultsCsvWriter();

    ScanResultsCsvWriter() = delete;
    ScanResultsCsvWriter(const ScanResultsCsvWriter&) = delete;
    ScanResultsCsvWriter& operator=(const ScanResultsCsvWriter&) = delete;

    // Returns the number of data rows written.
    size_t write_report(const CanslimScanner::Core::ScanReport& scan_report);

    const std::string& get_file_path() const { return file_path; }
    bool is_initialized() const { return initialized; }

    static std::string get_header(ExportKind kind);
    static std::string format_result_row(int rank, const CanslimScanner::Core::SymbolResult& symbol_result);
    static std::string format_signal_row(const std::string& symbol, const CanslimScanner::Core::EntrySignal& entry_signal);
    // <directory>/<prefix>_<timestamp>.csv
    static std::string build_export_file_path(const std::string& export_directory, const std::string& prefix, const std::string& timestamp);
};

} // namespace Logging
} // namespace CanslimScanner

#endif // SCAN_RESULTS_CSV_WRITER_HPP
