#include "internal/text/text_normalizer.hpp"

#include <cstddef>

#include <algorithm>
#include <iostream>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/date_utils.hpp"
#include "internal/text/number_utils.hpp"
#include "internal/text/text_utils.hpp"

namespace vntn {
namespace text {

// =============================================================================
// 构造与析构
// =============================================================================

TextNormalizer::TextNormalizer() : TextNormalizer(NormalizerConfig::Default()) {}

TextNormalizer::TextNormalizer(const NormalizerConfig& config)
    : config_(config), config_error_(config.validate()) {
    if (!config_error_.isOk()) {
        std::cerr << "Error: invalid normalizer config: " << config_error_.message;
        if (!config_error_.detail.empty()) {
            std::cerr << " (" << config_error_.detail << ")";
        }
        std::cerr << ", falling back to defaults" << std::endl;
        config_ = NormalizerConfig::Default();
    }

    reading_.max_grouped_digits = config_.max_grouped_digits;
    reading_.full_groups = config_.read_full_groups;

    buildPasses();
}

TextNormalizer::~TextNormalizer() {}

void TextNormalizer::buildPasses() {
    // Order matters: each later pattern is made of pieces an earlier one consumes
    passes_.clear();
    passes_.emplace_back(PatternType::DATETIME,
        std::regex(R"((\d{4})-(\d{1,2})-(\d{1,2}) (\d{1,2}):(\d{1,2}):(\d{1,2}))"));
    passes_.emplace_back(PatternType::DATE_SLASH,
        std::regex(R"((\d{1,2})/(\d{1,2})/(\d{4}))"));
    passes_.emplace_back(PatternType::DATE_DASH,
        std::regex(R"((\d{1,2})-(\d{1,2})-(\d{4}))"));
    passes_.emplace_back(PatternType::DATE_YEAR_FIRST,
        std::regex(R"((\d{4})-(\d{1,2})-(\d{1,2}))"));
    // Unbounded digit runs are scanned by hand, see findDecimalSpans
    passes_.emplace_back(PatternType::DECIMAL_COMMA, std::regex());
    passes_.emplace_back(PatternType::DECIMAL_DOT, std::regex());
    passes_.emplace_back(PatternType::INTEGER,
        std::regex("\\b\\d{1," + std::to_string(config_.max_integer_digits) + "}\\b"));
}

// =============================================================================
// 主入口
// =============================================================================

std::string TextNormalizer::normalize(const std::string& text,
                                      std::vector<NormalizerMatch>* matches) const {
    if (text.empty()) return text;

    std::string result = collapseWhitespace(text);

    if (config_.separate_alphanumeric) {
        result = separateAlphanumeric(result);
    }

    // Hyphens between digits stay until the date passes have run
    if (config_.split_separators) {
        result = splitSeparators(result, true);
    }

    for (const auto& pass : passes_) {
        result = applyPass(result, pass.first, pass.second, matches);
    }

    if (config_.split_separators) {
        std::replace(result.begin(), result.end(), '-', ' ');
    }

    // Digit directly followed by punctuation or a symbol
    result = spaceDigitsBeforeSymbols(result);

    return result;
}

// =============================================================================
// 识别遍
// =============================================================================

std::vector<TextNormalizer::PassCandidate> TextNormalizer::findCandidates(
        const std::string& text, PatternType type, const std::regex& pattern) const {
    std::vector<PassCandidate> candidates;

    if (type == PatternType::DECIMAL_COMMA || type == PatternType::DECIMAL_DOT) {
        char separator = type == PatternType::DECIMAL_COMMA ? ',' : '.';
        for (auto& span : findDecimalSpans(text, separator)) {
            candidates.push_back({span.start, span.length,
                                  {text.substr(span.start, span.length),
                                   std::move(span.integer_part),
                                   std::move(span.fraction_part)}});
        }
        return candidates;
    }

    std::sregex_iterator it(text.begin(), text.end(), pattern);
    std::sregex_iterator end;
    for (; it != end; ++it) {
        PassCandidate candidate;
        candidate.position = static_cast<size_t>(it->position());
        candidate.length = static_cast<size_t>(it->length());
        for (size_t i = 0; i < it->size(); ++i) {
            candidate.groups.push_back((*it)[i].str());
        }
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

std::string TextNormalizer::applyPass(const std::string& text,
                                      PatternType type,
                                      const std::regex& pattern,
                                      std::vector<NormalizerMatch>* matches) const {
    std::vector<PassCandidate> candidates = findCandidates(text, type, pattern);
    if (candidates.empty()) return text;

    std::string result;
    result.reserve(text.length());

    size_t last_pos = 0;
    for (const auto& candidate : candidates) {
        // 添加匹配前的文本
        result += text.substr(last_pos, candidate.position - last_pos);

        std::string normalized = convertMatch(type, candidate.groups);

        if (config_.verbose) {
            std::cout << "Info: [" << patternTypeToString(type) << "] '"
                << candidate.groups[0] << "' -> '" << normalized << "'" << std::endl;
        }
        if (matches) {
            matches->push_back({type, candidate.position, candidate.length,
                                candidate.groups[0], normalized});
        }

        result += normalized;
        last_pos = candidate.position + candidate.length;
    }

    // 添加剩余文本
    result += text.substr(last_pos);
    return result;
}

std::string TextNormalizer::convertMatch(PatternType type,
                                         const std::vector<std::string>& groups) const {
    switch (type) {
        case PatternType::DATETIME:
            return datetimeToVietnamese(groups[1], groups[2], groups[3],
                                        groups[4], groups[5], groups[6],
                                        reading_);
        case PatternType::DATE_SLASH:
        case PatternType::DATE_DASH:
            return dateToVietnamese(
                makeDateComponents(groups[1], groups[2], groups[3],
                                   DateOrder::DAY_FIRST),
                reading_);
        case PatternType::DATE_YEAR_FIRST:
            return dateToVietnamese(
                makeDateComponents(groups[1], groups[2], groups[3],
                                   DateOrder::YEAR_FIRST),
                reading_);
        case PatternType::DECIMAL_COMMA:
        case PatternType::DECIMAL_DOT:
            return decimalToVietnamese(groups[1], groups[2], reading_);
        case PatternType::INTEGER:
            return numberToVietnamese(groups[0], reading_);
        default:
            std::cerr << "Warning: unhandled pattern type "
                << static_cast<int>(type) << ", left unchanged" << std::endl;
            return groups[0];
    }
}

// =============================================================================
// 便捷函数
// =============================================================================

std::string normalizeText(const std::string& text) {
    static const TextNormalizer normalizer;
    return normalizer.normalize(text);
}

}  // namespace text
}  // namespace vntn
