#include "scan_results_csv_writer.hpp"
#include "async_logger.hpp"
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace CanslimScanner {
namespace Logging {

using namespace CanslimScanner::Core;

ScanResultsCsvWriter::ScanResultsCsvWriter(const std::string& export_file_path, ExportKind kind)
    : file_path(export_file_path), export_kind(kind) {
    try {
        std::filesystem::path file_path_obj(file_path);
        if (file_path_obj.has_parent_path()) {
            std::filesystem::create_directories(file_path_obj.parent_path());
        }

        file_stream.open(file_path, std::ios::out | std::ios::trunc);
        if (!file_stream.is_open()) {
            throw std::runtime_error("Failed to open export file: " + file_path);
        }

        initialized = true;
        write_header();
    } catch (const std::exception& e) {
        log_message(std::string("ERROR: Failed to initialize scan results writer: ") + e.what(), "");
        throw;
    }
}

ScanResultsCsvWriter::~ScanResultsCsvWriter() {
    if (file_stream.is_open()) {
        file_stream.close();
    }
}

std::string ScanResultsCsvWriter::get_header(ExportKind kind) {
    if (kind == ExportKind::ENTRY_SIGNALS) {
        return "Symbol,Date,Signal,Close,RSI,DistEMA8Pct,DistEMA21Pct";
    }
    return "Rank,Symbol,CANSLIM,RS,RSRating,Trend,Close,ProximityToHigh,C,A,N,S,L,I,M,Degraded,Signals,LatestSignal";
}

std::string ScanResultsCsvWriter::build_export_file_path(const std::string& export_directory, const std::string& prefix, const std::string& timestamp) {
    return export_directory + "/" + prefix + "_" + timestamp + ".csv";
}

void ScanResultsCsvWriter::write_header() {
    if (!file_stream.is_open()) {
        throw std::runtime_error("Cannot write header - file not open");
    }
    file_stream << get_header(export_kind) << "\n";
    file_stream.flush();
}

void ScanResultsCsvWriter::ensure_initialized() {
    if (!initialized || !file_stream.is_open()) {
        throw std::runtime_error("Scan results writer not properly initialized");
    }
}

std::string ScanResultsCsvWriter::format_result_row(int rank, const SymbolResult& symbol_result) {
    std::ostringstream row_stream;
    row_stream << rank << "," << symbol_result.symbol << ","
               << std::fixed << std::setprecision(2)
               << (symbol_result.composite ? symbol_result.composite->total : 0.0) << ","
               << (symbol_result.rs_score ? symbol_result.rs_score->value : 0.0) << ","
               << symbol_result.rs_rating << ","
               << (symbol_result.trend_score ? symbol_result.trend_score->score : 0.0) << ","
               << symbol_result.latest_close << ","
               << std::setprecision(4) << symbol_result.proximity_to_high << std::setprecision(2);

    for (CanslimCriterion criterion : ALL_CANSLIM_CRITERIA) {
        row_stream << ",";
        if (symbol_result.composite) {
            std::map<CanslimCriterion, CanslimSubScore>::const_iterator sub_score_iterator = symbol_result.composite->sub_scores.find(criterion);
            if (sub_score_iterator != symbol_result.composite->sub_scores.end()) {
                row_stream << sub_score_iterator->second.value;
            }
        }
    }

    row_stream << "," << (symbol_result.composite ? symbol_result.composite->degraded_criteria() : "")
               << "," << symbol_result.entry_signals.size() << ",";
    if (!symbol_result.entry_signals.empty()) {
        const EntrySignal& latest_signal = symbol_result.entry_signals.back();
        row_stream << latest_signal.date << " " << signal_type_to_string(latest_signal.signal_type);
    }
    return row_stream.str();
}

std::string ScanResultsCsvWriter::format_signal_row(const std::string& symbol, const EntrySignal& entry_signal) {
    std::ostringstream row_stream;
    row_stream << symbol << "," << entry_signal.date << "," << signal_type_to_string(entry_signal.signal_type) << ","
               << std::fixed << std::setprecision(2) << entry_signal.close_price << ","
               << entry_signal.rsi << ","
               << std::setprecision(3) << entry_signal.distance_ema_short_pct << ","
               << entry_signal.distance_ema_long_pct;
    return row_stream.str();
}

size_t ScanResultsCsvWriter::write_report(const ScanReport& scan_report) {
    ensure_initialized();

    std::lock_guard<std::mutex> lock(file_mutex);
    size_t rows_written = 0;
    int rank = 1;
    for (const SymbolResult& symbol_result : scan_report.ranked_results) {
        if (export_kind == ExportKind::RANKED_RESULTS) {
            file_stream << format_result_row(rank++, symbol_result) << "\n";
            ++rows_written;
        } else {
            for (const EntrySignal& entry_signal : symbol_result.entry_signals) {
                file_stream << format_signal_row(symbol_result.symbol, entry_signal) << "\n";
                ++rows_written;
            }
        }
    }
    file_stream.flush();
    if (!file_stream.good()) {
        throw std::runtime_error("Failed writing export file: " + file_path);
    }
    return rows_written;
}

} // namespace Logging
} // namespace CanslimScanner
