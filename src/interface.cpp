// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "confscrub.h"
#include "configuration.hpp"
#include "instance.hpp"
#include "log.hpp"
#include "scan_result.hpp"
#include "version.hpp"

using namespace confscrub;

static_assert(static_cast<int>(match_reason::none) == CONFSCRUB_REASON_NONE);
static_assert(static_cast<int>(match_reason::key_name) == CONFSCRUB_REASON_KEY_NAME);
static_assert(static_cast<int>(match_reason::value_pattern) == CONFSCRUB_REASON_VALUE_PATTERN);

namespace {

std::string_view to_view(const char *str) { return str == nullptr ? std::string_view{} : str; }

configuration configuration_from_c(const confscrub_config *config)
{
    configuration cfg;
    if (config == nullptr) {
        return cfg;
    }

    if (config->redaction.marker != nullptr) {
        cfg.redaction_marker = config->redaction.marker;
    }

    cfg.check_values = config->check_values;
    cfg.include_comments = config->include_comments;
    cfg.remove_comments = config->remove_comments;

    cfg.set_patterns(to_view(config->patterns.key_regex),
        to_view(config->patterns.exclusion_regex), to_view(config->patterns.value_regex));

    return cfg;
}

char *copy_string(std::string_view str)
{
    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    auto *copy = new char[str.size() + 1];
    if (!str.empty()) {
        memcpy(copy, str.data(), str.size());
    }
    copy[str.size()] = '\0';
    return copy;
}

void fill_result(const render_result &rendered, confscrub_result &result)
{
    result.text = copy_string(rendered.redacted_text);
    result.length = rendered.redacted_text.size();

    if (rendered.findings.empty()) {
        return;
    }

    if (rendered.findings.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("too many findings");
    }

    // NOLINTNEXTLINE(cppcoreguidelines-owning-memory)
    result.findings = new confscrub_finding[rendered.findings.size()]{};
    for (const auto &finding : rendered.findings) {
        auto &entry = result.findings[result.size++];
        entry.line = finding.line;
        entry.reason = static_cast<CONFSCRUB_REASON>(finding.reason);
        entry.commented = finding.commented;
        entry.key = copy_string(finding.key);
        entry.pattern = copy_string(finding.pattern);
        if (finding.section.has_value()) {
            entry.section = copy_string(*finding.section);
        }
    }
}

} // namespace

extern "C" {

confscrub::instance *confscrub_init(const confscrub_config *config)
{
    try {
        auto *handle = new confscrub::instance{configuration_from_c(config)};
        CONFSCRUB_DEBUG("instance initialised, marker '{}', check values {}",
            handle->config().redaction_marker, handle->config().check_values);
        return handle;
    } catch (const std::exception &e) {
        CONFSCRUB_ERROR("{}", e.what());
    } catch (...) {
        CONFSCRUB_ERROR("unknown exception");
    }

    return nullptr;
}

void confscrub_destroy(confscrub::instance *handle)
{
    try {
        delete handle;
    } catch (const std::exception &e) {
        CONFSCRUB_ERROR("{}", e.what());
    } catch (...) {
        CONFSCRUB_ERROR("unknown exception");
    }
}

CONFSCRUB_RET_CODE confscrub_redact(
    confscrub::instance *handle, const char *document, size_t length, confscrub_result *result)
{
    if (handle == nullptr || result == nullptr || (document == nullptr && length > 0)) {
        CONFSCRUB_WARN("invalid argument");
        return CONFSCRUB_ERR_INVALID_ARGUMENT;
    }

    *result = confscrub_result{};

    try {
        const std::string_view input{document == nullptr ? "" : document, length};
        auto rendered = handle->redact(input);
        fill_result(rendered, *result);
        return rendered.findings.empty() ? CONFSCRUB_OK : CONFSCRUB_MATCH;
    } catch (const std::exception &e) {
        CONFSCRUB_ERROR("{}", e.what());
    } catch (...) {
        CONFSCRUB_ERROR("unknown exception");
    }

    confscrub_result_free(result);
    return CONFSCRUB_ERR_INTERNAL;
}

void confscrub_result_free(confscrub_result *result)
{
    if (result == nullptr) {
        return;
    }

    // NOLINTBEGIN(cppcoreguidelines-owning-memory)
    for (uint32_t i = 0; i < result->size; ++i) {
        auto &entry = result->findings[i];
        delete[] entry.section;
        delete[] entry.key;
        delete[] entry.pattern;
    }
    delete[] result->findings;
    delete[] result->text;
    // NOLINTEND(cppcoreguidelines-owning-memory)

    *result = confscrub_result{};
}

const char *confscrub_reason_to_str(CONFSCRUB_REASON reason)
{
    switch (reason) {
    case CONFSCRUB_REASON_KEY_NAME:
        return "key_name";
    case CONFSCRUB_REASON_VALUE_PATTERN:
        return "value_pattern";
    case CONFSCRUB_REASON_NONE:
        break;
    }
    return "none";
}

const char *confscrub_get_version() { return confscrub::current_version.data(); }

bool confscrub_set_log_cb(confscrub_log_cb cb, CONFSCRUB_LOG_LEVEL min_level)
{
    confscrub::logger::init(cb, min_level);
    CONFSCRUB_INFO("Sending log messages to binding, min level {}", log_level_to_str(min_level));
    return true;
}

} // extern "C"
