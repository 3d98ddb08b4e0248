#include "record_normalizer.hpp"
#include "conversion_error.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace record_normalizer {

namespace {

struct LeadingNumber {
    std::string integer;   // no leading zeros
    std::string fraction;  // no trailing zeros
};

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

LeadingNumber leading_number(const std::string& line) {
    LeadingNumber number;
    size_t i = 0;
    while (i < line.size() && is_digit(line[i])) ++i;
    size_t first_significant = 0;
    while (first_significant < i && line[first_significant] == '0') ++first_significant;
    number.integer = line.substr(first_significant, i - first_significant);

    if (i < line.size() && line[i] == '.') {
        size_t j = i + 1;
        while (j < line.size() && is_digit(line[j])) ++j;
        number.fraction = line.substr(i + 1, j - i - 1);
        while (!number.fraction.empty() && number.fraction.back() == '0') number.fraction.pop_back();
    }
    return number;
}

int compare_numbers(const LeadingNumber& a, const LeadingNumber& b) {
    if (a.integer.size() != b.integer.size()) {
        return a.integer.size() < b.integer.size() ? -1 : 1;
    }
    int c = a.integer.compare(b.integer);
    if (c != 0) return c;
    return a.fraction.compare(b.fraction);
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(' ') == std::string::npos;
}

} // namespace

bool record_less(const std::string& a, const std::string& b) {
    int c = compare_numbers(leading_number(a), leading_number(b));
    if (c != 0) return c < 0;
    return a < b;
}

std::vector<std::string> normalize_dump(const std::string& raw_dump) {
    std::vector<std::string> records;
    std::istringstream in(raw_dump);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) {
            header = false;
            continue;
        }
        if (is_blank(line)) continue;
        if (!is_digit(line[0])) continue;
        records.push_back(line);
    }
    std::stable_sort(records.begin(), records.end(), record_less);
    return records;
}

std::string render_records(const std::vector<std::string>& records) {
    std::string out;
    for (const auto& record : records) {
        out += record;
        out += '\n';
    }
    return out;
}

RecordNormalizer::RecordNormalizer(const NormalizerConfig& config)
    : config_(config) {}

void RecordNormalizer::normalize() {
    records_ = normalize_dump(load_dump());
    save_output();
    std::cout << "[record_normalizer] Wrote " << records_.size() << " flow records to " << config_.output_file << "\n";
}

const std::vector<std::string>& RecordNormalizer::records() const {
    return records_;
}

std::string RecordNormalizer::load_dump() const {
    std::error_code ec;
    if (!fs::is_directory(config_.scratch_dir, ec)) {
        throw conversion::Error(conversion::ErrorKind::DumpToolFailed,
                                "Scratch directory '" + config_.scratch_dir + "' does not exist");
    }
    if (fs::is_empty(config_.scratch_dir, ec)) {
        std::cerr << "[record_normalizer] Warning: no collector files in " << config_.scratch_dir
                  << ", writing an empty flow file\n";
        return {};
    }

    auto argv = config_.dump_tool.expand({{"dir", config_.scratch_dir}});
    if (config_.verbose) {
        std::cout << "[record_normalizer] Command: " << subprocess::join_command(argv) << "\n";
    }

    std::string dump;
    subprocess::ExitStatus status;
    try {
        status = subprocess::run_capture(argv, dump);
    } catch (const std::exception& e) {
        throw conversion::Error(conversion::ErrorKind::DumpToolFailed,
                                "Could not run dump tool '" + subprocess::join_command(argv) + "': " + e.what());
    }
    if (!status.success()) {
        throw conversion::Error(conversion::ErrorKind::DumpToolFailed,
                                "Dump tool failed on " + config_.scratch_dir + " (" + status.describe() + ")");
    }
    return dump;
}

// Written beside the target and renamed over it, so readers never see a partial file.
void RecordNormalizer::save_output() const {
    const std::string part_file = config_.output_file + ".part";
    std::ofstream out(part_file, std::ios::trunc | std::ios::binary);
    if (!out.is_open()) {
        throw conversion::Error(conversion::ErrorKind::OutputWriteFailed,
                                "Could not open output file '" + part_file + "'");
    }
    out << render_records(records_);
    out.close();
    std::error_code ec;
    if (!out) {
        fs::remove(part_file, ec);
        throw conversion::Error(conversion::ErrorKind::OutputWriteFailed,
                                "Could not write output file '" + part_file + "'");
    }

    fs::rename(part_file, config_.output_file, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(part_file, ignored);
        throw conversion::Error(conversion::ErrorKind::OutputWriteFailed,
                                "Could not move " + part_file + " to " + config_.output_file + ": " + ec.message());
    }
}

} // namespace record_normalizer
