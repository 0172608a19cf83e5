#include "vntn_api.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/text_normalizer.hpp"
#include "internal/vntn_config.hpp"

namespace Vntn {

namespace {

const char* const MOVED_FROM_MESSAGE = "Normalizer has been moved from";

vntn::NormalizerConfig toInternalConfig(const NormalizerOptions& options) {
    vntn::NormalizerConfig config;
    config.separate_alphanumeric = options.separate_alphanumeric;
    config.split_separators = options.split_separators;
    config.max_grouped_digits = static_cast<size_t>(std::max(0, options.max_grouped_digits));
    config.max_integer_digits = static_cast<size_t>(std::max(0, options.max_integer_digits));
    config.read_full_groups = options.read_full_groups;
    config.verbose = options.verbose;
    return config;
}

NormalizerOptions fromInternalConfig(const vntn::NormalizerConfig& config) {
    NormalizerOptions options;
    options.separate_alphanumeric = config.separate_alphanumeric;
    options.split_separators = config.split_separators;
    options.max_grouped_digits = static_cast<int>(config.max_grouped_digits);
    options.max_integer_digits = static_cast<int>(config.max_integer_digits);
    options.read_full_groups = config.read_full_groups;
    options.verbose = config.verbose;
    return options;
}

}  // namespace

// =============================================================================
// Normalizer 实现
// =============================================================================

struct Normalizer::Impl {
    explicit Impl(const vntn::NormalizerConfig& config) : normalizer(config) {}

    vntn::text::TextNormalizer normalizer;
};

Normalizer::Normalizer() : impl_(std::make_unique<Impl>(vntn::NormalizerConfig::Default())) {}

Normalizer::Normalizer(const NormalizerOptions& options)
    : impl_(std::make_unique<Impl>(toInternalConfig(options))) {}

Normalizer::~Normalizer() = default;

Normalizer::Normalizer(Normalizer&&) noexcept = default;
Normalizer& Normalizer::operator=(Normalizer&&) noexcept = default;

std::string Normalizer::Normalize(const std::string& text) const {
    if (!impl_) {
        std::cerr << "Warning: " << MOVED_FROM_MESSAGE << ", text left unchanged" << std::endl;
        return text;
    }
    return impl_->normalizer.normalize(text);
}

std::string Normalizer::NormalizeWithTrace(const std::string& text,
                                           std::vector<MatchInfo>& trace) const {
    if (!impl_) {
        std::cerr << "Warning: " << MOVED_FROM_MESSAGE << ", text left unchanged" << std::endl;
        return text;
    }

    std::vector<vntn::text::NormalizerMatch> matches;
    std::string result = impl_->normalizer.normalize(text, &matches);

    for (auto& match : matches) {
        MatchInfo info;
        info.type = vntn::text::patternTypeToString(match.type);
        info.start = match.start;
        info.length = match.length;
        info.original = std::move(match.original);
        info.normalized = std::move(match.normalized);
        trace.push_back(std::move(info));
    }
    return result;
}

NormalizerOptions Normalizer::GetOptions() const {
    if (!impl_) return NormalizerOptions::Default();
    return fromInternalConfig(impl_->normalizer.getConfig());
}

bool Normalizer::IsValid() const {
    if (!impl_) return false;
    return impl_->normalizer.getConfigError().isOk();
}

std::string Normalizer::GetLastError() const {
    if (!impl_) return MOVED_FROM_MESSAGE;

    const auto& error = impl_->normalizer.getConfigError();
    if (error.isOk()) return "";

    std::string message = std::string(vntn::errorCodeToString(error.code)) + ": " + error.message;
    if (!error.detail.empty()) {
        message += " (" + error.detail + ")";
    }
    return message;
}

// =============================================================================
// 便捷函数
// =============================================================================

std::string Normalize(const std::string& text) {
    return vntn::text::normalizeText(text);
}

}  // namespace Vntn
