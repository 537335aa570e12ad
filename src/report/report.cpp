// ==============================================================================
// report.cpp - Разбор текстового отчёта сканера секретов
// ==============================================================================

#include <scanconv/report.hpp>

#include <scanconv/platform.hpp>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

namespace scanconv::report {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

bool starts_with(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool contains(std::string_view str, std::string_view needle) {
    return str.find(needle) != std::string_view::npos;
}

/// Значение после первого ':' без пробелов по краям
std::string value_after_colon(std::string_view line) {
    auto pos = line.find(':');
    if (pos == std::string_view::npos) {
        return {};
    }
    return std::string(trim(line.substr(pos + 1)));
}

/// Длина корректной UTF-8 последовательности, начинающейся в bytes[i], или 0
std::size_t utf8_sequence_length(std::string_view bytes, std::size_t i) {
    const auto b0 = static_cast<unsigned char>(bytes[i]);
    if (b0 < 0x80) {
        return 1;
    }

    std::size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 == 0xE0) {
        len = 3;
        lo = 0xA0;
    } else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF) {
        len = 3;
    } else if (b0 == 0xED) {
        // U+D800..U+DFFF (суррогаты) недопустимы
        len = 3;
        hi = 0x9F;
    } else if (b0 == 0xF0) {
        len = 4;
        lo = 0x90;
    } else if (b0 >= 0xF1 && b0 <= 0xF3) {
        len = 4;
    } else if (b0 == 0xF4) {
        len = 4;
        hi = 0x8F;
    } else {
        return 0;
    }

    if (i + len > bytes.size()) {
        return 0;
    }

    // Первый continuation-байт с уточнёнными границами, остальные 80..BF
    const auto b1 = static_cast<unsigned char>(bytes[i + 1]);
    if (b1 < lo || b1 > hi) {
        return 0;
    }
    for (std::size_t k = 2; k < len; ++k) {
        const auto b = static_cast<unsigned char>(bytes[i + k]);
        if (b < 0x80 || b > 0xBF) {
            return 0;
        }
    }
    return len;
}

}  // namespace

// ----------------------------------------------------------------------------
// SecretRecord
// ----------------------------------------------------------------------------

void SecretRecord::set_extra(std::string key, std::string value) {
    for (auto& [k, v] : extra_fields) {
        if (k == key) {
            v = std::move(value);
            return;
        }
    }
    extra_fields.emplace_back(std::move(key), std::move(value));
}

const std::string* SecretRecord::extra(std::string_view key) const {
    for (const auto& [k, v] : extra_fields) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

bool SecretRecord::operator==(const SecretRecord& other) const {
    return detector_type == other.detector_type && decoder_type == other.decoder_type &&
           raw_value == other.raw_value && file_path == other.file_path &&
           line_number == other.line_number && verified == other.verified &&
           group_id == other.group_id && extra_fields == other.extra_fields;
}

// ----------------------------------------------------------------------------
// ReportParser
// ----------------------------------------------------------------------------

void ReportParser::feed(std::string_view raw_line) {
    ++stats_.lines;

    // ESC встречается только при выводе trufflehog в TTY
    std::string cleaned;
    std::string_view line = raw_line;
    if (line.find('\x1b') != std::string_view::npos) {
        cleaned = strip_ansi(line);
        line = cleaned;
    }
    line = trim_right(line);

    // Маркеры проверяются в любом состоянии: закрывают текущую запись и
    // открывают новую
    const bool unverified = contains(line, UNVERIFIED_MARKER);
    if (unverified || contains(line, VERIFIED_MARKER)) {
        close_current();
        ++stats_.markers;
        current_ = SecretRecord{};
        current_.verified = !unverified;
        state_ = State::Accumulating;
        return;
    }

    // Idle: строки до первого маркера игнорируются
    if (state_ == State::Accumulating) {
        apply_field(line);
    }
}

void ReportParser::apply_field(std::string_view line) {
    if (starts_with(line, DETECTOR_TYPE_PREFIX)) {
        current_.detector_type = value_after_colon(line);
    } else if (starts_with(line, DECODER_TYPE_PREFIX)) {
        current_.decoder_type = value_after_colon(line);
    } else if (starts_with(line, RAW_RESULT_PREFIX)) {
        current_.raw_value = value_after_colon(line);
    } else if (starts_with(line, FILE_PREFIX)) {
        current_.file_path = value_after_colon(line);
    } else if (starts_with(line, LINE_PREFIX)) {
        current_.line_number = value_after_colon(line);
    } else if (!line.empty() && !is_space(line.front())) {
        auto pos = line.find(':');
        if (pos != std::string_view::npos) {
            current_.set_extra(std::string(trim(line.substr(0, pos))),
                               std::string(trim(line.substr(pos + 1))));
        }
    }
}

void ReportParser::close_current() {
    if (state_ != State::Accumulating) {
        return;
    }
    if (!current_.raw_value.empty()) {
        records_.push_back(std::move(current_));
    } else {
        ++stats_.dropped_records;
    }
    current_ = SecretRecord{};
    state_ = State::Idle;
}

std::vector<SecretRecord> ReportParser::finish() {
    close_current();
    std::vector<SecretRecord> records;
    records.swap(records_);
    return records;
}

// ----------------------------------------------------------------------------
// ReportError
// ----------------------------------------------------------------------------

std::string ReportError::format() const {
    std::ostringstream oss;
    oss << "failed to read report";
    if (!path.empty()) {
        oss << " '" << path << "'";
    }
    oss << " - " << message;
    return oss.str();
}

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

std::vector<SecretRecord> parse(std::string_view text, ParseStats& stats) {
    ReportParser parser;

    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        parser.feed(text.substr(start, end - start));
        start = end + 1;
    }

    auto records = parser.finish();
    std::size_t invalid_bytes = stats.invalid_bytes;
    stats = parser.stats();
    stats.invalid_bytes = invalid_bytes;
    return records;
}

std::vector<SecretRecord> parse(std::string_view text) {
    ParseStats stats;
    return parse(text, stats);
}

ParseResult parse_file(const std::filesystem::path& path) {
    ParseResult result;
    result.error.path = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        result.error.message = ec ? ec.message() : "file does not exist";
        return result;
    }
    if (std::filesystem::is_directory(path, ec)) {
        result.error.message = "is a directory";
        return result;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        result.error.message = std::strerror(errno);
        return result;
    }

    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        result.error.message = "I/O error while reading";
        return result;
    }

    std::size_t dropped = 0;
    std::string text = sanitize_utf8(bytes, &dropped);

    result.stats.invalid_bytes = dropped;
    result.records = parse(text, result.stats);
    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string sanitize_utf8(std::string_view bytes, std::size_t* dropped) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t skipped = 0;

    std::size_t i = 0;
    while (i < bytes.size()) {
        std::size_t len = utf8_sequence_length(bytes, i);
        if (len == 0) {
            // Отбрасываем только ведущий байт, продолжение может оказаться
            // началом корректной последовательности
            ++skipped;
            ++i;
            continue;
        }
        out.append(bytes.substr(i, len));
        i += len;
    }

    if (dropped != nullptr) {
        *dropped = skipped;
    }
    return out;
}

std::string strip_ansi(std::string_view line) {
    std::string out;
    out.reserve(line.size());

    std::size_t i = 0;
    while (i < line.size()) {
        if (line[i] == '\x1b' && i + 1 < line.size() && line[i + 1] == '[') {
            // CSI: параметры 0x30..0x3F, промежуточные 0x20..0x2F, финальный 0x40..0x7E
            std::size_t j = i + 2;
            while (j < line.size() && line[j] >= 0x20 && line[j] <= 0x3F) {
                ++j;
            }
            if (j < line.size() && line[j] == 'm') {
                i = j + 1;
                continue;
            }
        }
        out += line[i];
        ++i;
    }
    return out;
}

std::string_view trim(std::string_view s) {
    std::size_t b = 0;
    while (b < s.size() && is_space(s[b])) {
        ++b;
    }
    std::size_t e = s.size();
    while (e > b && is_space(s[e - 1])) {
        --e;
    }
    return s.substr(b, e - b);
}

std::string_view trim_right(std::string_view s) {
    std::size_t e = s.size();
    while (e > 0 && is_space(s[e - 1])) {
        --e;
    }
    return s.substr(0, e);
}

}  // namespace scanconv::report
