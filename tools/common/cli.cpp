// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <yaml-cpp/emitter.h>
#include <yaml-cpp/emittermanip.h>
#include <yaml-cpp/node/parse.h>

#include "cli.hpp"
#include "confscrub.h"
#include "utils.hpp"

using namespace std::literals;

namespace {

struct option_spec {
    std::string_view name;
    bool takes_value;
};

const std::vector<std::string> &values(const cli_arguments &args, std::string_view name)
{
    static const std::vector<std::string> empty;
    auto it = args.find(std::string{name});
    return it == args.end() ? empty : it->second;
}

const std::string &last_value(const cli_arguments &args, std::string_view name)
{
    static const std::string empty;
    const auto &all = values(args, name);
    return all.empty() ? empty : all.back();
}

void report_text(std::ostream &err, std::string_view path, const confscrub_result &result)
{
    for (uint32_t i = 0; i < result.size; ++i) {
        const auto &finding = result.findings[i];
        err << path << ':' << finding.line << ": ";
        if (finding.section != nullptr) {
            err << '[' << finding.section << "] ";
        }
        err << finding.key << " (" << confscrub_reason_to_str(finding.reason) << ": "
            << finding.pattern << ")" << (finding.commented ? " [commented]" : "") << '\n';
    }

    if (result.size == 0) {
        err << path << ": no sensitive data found\n";
    } else {
        err << path << ": redacted " << result.size << " sensitive fields\n";
    }
}

void report_yaml(YAML::Emitter &out, std::string_view path, const confscrub_result &result)
{
    out << YAML::BeginMap;
    out << YAML::Key << "file" << YAML::Value << std::string{path};
    out << YAML::Key << "findings" << YAML::Value << YAML::BeginSeq;
    for (uint32_t i = 0; i < result.size; ++i) {
        const auto &finding = result.findings[i];
        out << YAML::BeginMap;
        out << YAML::Key << "line" << YAML::Value << finding.line;
        out << YAML::Key << "section" << YAML::Value;
        if (finding.section != nullptr) {
            out << finding.section;
        } else {
            out << YAML::Null;
        }
        out << YAML::Key << "key" << YAML::Value << finding.key;
        out << YAML::Key << "reason" << YAML::Value << confscrub_reason_to_str(finding.reason);
        out << YAML::Key << "pattern" << YAML::Value << finding.pattern;
        out << YAML::Key << "commented" << YAML::Value << finding.commented;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

void report_json(rapidjson::Document &doc, std::string_view path, const confscrub_result &result)
{
    auto &alloc = doc.GetAllocator();
    auto string_value = [&alloc](std::string_view str) {
        rapidjson::Value value;
        value.SetString(str.data(), static_cast<rapidjson::SizeType>(str.size()), alloc);
        return value;
    };

    rapidjson::Value findings(rapidjson::kArrayType);
    for (uint32_t i = 0; i < result.size; ++i) {
        const auto &finding = result.findings[i];

        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("line", static_cast<uint64_t>(finding.line), alloc);
        if (finding.section != nullptr) {
            entry.AddMember("section", string_value(finding.section), alloc);
        } else {
            entry.AddMember("section", rapidjson::Value(rapidjson::kNullType), alloc);
        }
        entry.AddMember("key", string_value(finding.key), alloc);
        entry.AddMember(
            "reason", rapidjson::StringRef(confscrub_reason_to_str(finding.reason)), alloc);
        entry.AddMember("pattern", string_value(finding.pattern), alloc);
        entry.AddMember("commented", finding.commented, alloc);
        findings.PushBack(entry, alloc);
    }

    rapidjson::Value file(rapidjson::kObjectType);
    file.AddMember("file", string_value(path), alloc);
    file.AddMember("findings", findings, alloc);
    doc.PushBack(file, alloc);
}

} // namespace

// NOLINTNEXTLINE(modernize-avoid-c-arrays)
cli_arguments parse_args(int argc, const char *const argv[])
{
    const std::map<std::string, option_spec, std::less<>> arg_mapping{
        {"-o", {"--output", true}}, {"--output", {"--output", true}},
        {"-r", {"--redaction-text", true}}, {"--redaction-text", {"--redaction-text", true}},
        {"-c", {"--config", true}}, {"--config", {"--config", true}},
        {"--format", {"--format", true}}, {"--backup-suffix", {"--backup-suffix", true}},
        {"-i", {"--in-place", false}}, {"--in-place", {"--in-place", false}},
        {"-b", {"--backup", false}}, {"--backup", {"--backup", false}},
        {"--no-check-values", {"--no-check-values", false}},
        {"--include-comments", {"--include-comments", false}},
        {"--remove-comments", {"--remove-comments", false}},
        {"--report", {"--report", false}}, {"--check", {"--check", false}},
        {"-v", {"--verbose", false}}, {"--verbose", {"--verbose", false}},
        {"-h", {"--help", false}}, {"--help", {"--help", false}}};

    cli_arguments args;
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg.size() > 1 && arg.starts_with('-')) {
            auto long_arg = arg_mapping.find(arg);
            if (long_arg == arg_mapping.end()) {
                args["--unknown"].emplace_back(arg);
                continue;
            }

            auto &option_values = args[std::string{long_arg->second.name}];
            if (long_arg->second.takes_value) {
                if (i + 1 >= argc) {
                    args["--missing-value"].emplace_back(arg);
                    continue;
                }
                option_values.emplace_back(argv[++i]);
            }
        } else {
            args["--input"].emplace_back(arg);
        }
    }
    return args;
}

void print_usage(std::string_view program, std::ostream &out)
{
    out << "Usage: " << program << " [options] <toml file> [<toml file>..]\n"
        << "  -o, --output <file>          write the redacted document to a file\n"
        << "  -i, --in-place               overwrite the input files\n"
        << "  -b, --backup                 keep a copy of each input before overwriting\n"
        << "      --backup-suffix <suffix> backup suffix (default: .bak)\n"
        << "  -r, --redaction-text <text>  replacement text (default: ***REDACTED***)\n"
        << "  -c, --config <yaml file>     load options and extra patterns\n"
        << "      --no-check-values        only use key names\n"
        << "      --include-comments       also redact commented-out lines\n"
        << "      --remove-comments        drop comment lines from the output\n"
        << "      --report                 print the findings to stderr\n"
        << "      --check                  only report, don't output the document\n"
        << "      --format <text|json|yaml> report format (default: text)\n"
        << "  -v, --verbose                print library logs\n";
}

int run(std::string_view program, const cli_arguments &args, std::ostream &out,
    std::ostream &err)
{
    const auto &inputs = values(args, "--input");
    const bool help = args.contains("--help");
    if (help || args.contains("--unknown") || args.contains("--missing-value") ||
        inputs.empty()) {
        for (const auto &unknown : values(args, "--unknown")) {
            err << "Unknown option: " << unknown << '\n';
        }
        for (const auto &option : values(args, "--missing-value")) {
            err << "Missing value for option: " << option << '\n';
        }
        print_usage(program, err);
        return help && !args.contains("--unknown") && !args.contains("--missing-value")
                   ? exit_clean
                   : exit_error;
    }

    const auto &output = last_value(args, "--output");
    const bool in_place = args.contains("--in-place");
    if (!output.empty() && inputs.size() > 1) {
        err << "--output requires a single input file\n";
        return exit_error;
    }

    if (!output.empty() && in_place) {
        err << "--output and --in-place are mutually exclusive\n";
        return exit_error;
    }

    const auto &format = last_value(args, "--format");
    if (!format.empty() && format != "text" && format != "json" && format != "yaml") {
        err << "Unknown report format: " << format << '\n';
        return exit_error;
    }
    const bool json_report = format == "json";
    const bool yaml_report = format == "yaml";
    // Structured reports take over stdout
    const bool check_only = args.contains("--check") || json_report || yaml_report;
    const bool text_report =
        !json_report && !yaml_report && (args.contains("--report") || args.contains("--check"));

    scrub_settings settings;
    try {
        const auto &config_file = last_value(args, "--config");
        if (!config_file.empty()) {
            settings = YAML::Load(read_file(config_file)).as<scrub_settings>();
        }
    } catch (const std::exception &e) {
        err << "Failed to load configuration: " << e.what() << '\n';
        return exit_error;
    }

    scrub_settings overrides;
    if (args.contains("--redaction-text")) {
        overrides.redaction_marker = last_value(args, "--redaction-text");
    }
    if (args.contains("--no-check-values")) {
        overrides.check_values = false;
    }
    if (args.contains("--include-comments")) {
        overrides.include_comments = true;
    }
    if (args.contains("--remove-comments")) {
        overrides.remove_comments = true;
    }
    settings.merge(overrides);

    const auto config = settings.to_config();
    confscrub_handle handle = confscrub_init(&config);
    if (handle == nullptr) {
        err << "Invalid configuration\n";
        return exit_error;
    }

    std::string backup_suffix = ".bak";
    if (args.contains("--backup-suffix")) {
        backup_suffix = last_value(args, "--backup-suffix");
    }

    YAML::Emitter yaml_out;
    yaml_out.SetIndent(2);
    yaml_out.SetMapFormat(YAML::Block);
    yaml_out.SetSeqFormat(YAML::Block);
    if (yaml_report) {
        yaml_out << YAML::BeginSeq;
    }

    rapidjson::Document json_out(rapidjson::kArrayType);

    int retval = exit_clean;
    for (const auto &path : inputs) {
        confscrub_result result{};
        try {
            auto document = read_file(path);

            auto code = confscrub_redact(handle, document.data(), document.size(), &result);
            if (code < CONFSCRUB_OK) {
                err << path << ": failed to process document\n";
                retval = exit_error;
                continue;
            }

            if (code == CONFSCRUB_MATCH && retval == exit_clean) {
                retval = exit_findings;
            }

            const std::string_view redacted{result.text, result.length};
            if (!check_only) {
                if (in_place) {
                    if (args.contains("--backup")) {
                        backup_file(path, backup_suffix);
                    }
                    write_file(path, redacted);
                } else if (!output.empty()) {
                    write_file(output, redacted);
                } else {
                    out << redacted;
                }
            }

            if (text_report) {
                report_text(err, path, result);
            } else if (json_report) {
                report_json(json_out, path, result);
            } else if (yaml_report) {
                report_yaml(yaml_out, path, result);
            }
        } catch (const std::exception &e) {
            err << path << ": " << e.what() << '\n';
            retval = exit_error;
        }
        confscrub_result_free(&result);
    }

    if (yaml_report) {
        yaml_out << YAML::EndSeq;
        out << yaml_out.c_str() << '\n';
    } else if (json_report) {
        rapidjson::StringBuffer buffer;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        json_out.Accept(writer);
        out << buffer.GetString() << '\n';
    }

    confscrub_destroy(handle);

    return retval;
}
