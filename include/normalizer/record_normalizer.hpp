#ifndef RECORD_NORMALIZER_HPP
#define RECORD_NORMALIZER_HPP

#include <string>
#include <vector>
#include "subprocess.hpp"

namespace record_normalizer {

struct NormalizerConfig {
    std::string scratch_dir;  // collector output (nfcapd.*)
    std::string output_file;  // FlowFile, overwritten
    // Placeholder: {dir}
    subprocess::ToolCommand dump_tool{"nfdump", {"-N", "-o", "long", "-R", "{dir}"}};
    bool verbose = false;
};

// Orders records by their leading number as `sort -n` reads it, then by the
// whole line.
bool record_less(const std::string& a, const std::string& b);

// Strips the header line, blank lines and every line not starting with a
// digit, and sorts what remains.
std::vector<std::string> normalize_dump(const std::string& raw_dump);
std::string render_records(const std::vector<std::string>& records);

class RecordNormalizer {
public:
    explicit RecordNormalizer(const NormalizerConfig& config);
    void normalize();
    const std::vector<std::string>& records() const;

private:
    NormalizerConfig config_;
    std::vector<std::string> records_;

    std::string load_dump() const;
    void save_output() const;
};

} // namespace record_normalizer

#endif // RECORD_NORMALIZER_HPP
