// demo_format.cpp
//
// Formats one message from an FTL file:
//
//     ftl-format app.ftl welcome name=Anna count=3
//     ftl-format app.ftl login --attr placeholder --locale de
//     ftl-format app.ftl total --config ftl.toml amount=12.5
//
// Settings come from ~/.ftl/config.toml, then --config, then the flags.

#include <ftl/bundle.hpp>
#include <ftl/config.hpp>
#include <ftl/fs.hpp>
#include <ftl/log.hpp>

#include <charconv>
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using namespace ftl;

struct Options {
    std::string file;
    std::string message_id;
    std::optional<std::string> attribute;
    std::optional<std::string> locale;
    std::optional<std::string> config_path;
    FluentArgs args;
};

// "42" becomes an integer, "4.2" a double, anything else stays text
static FluentValue parse_arg_value(const std::string& text) {
    int64_t i = 0;
    auto ri = std::from_chars(text.data(), text.data() + text.size(), i);
    if (ri.ec == std::errc() && ri.ptr == text.data() + text.size()) return FluentValue(i);

    double d = 0.0;
    auto rd = std::from_chars(text.data(), text.data() + text.size(), d);
    if (rd.ec == std::errc() && rd.ptr == text.data() + text.size()) return FluentValue(d);

    return FluentValue(text);
}

static Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto flag_value = [&](const char* flag) -> Result<std::string> {
            if (i + 1 >= argc) {
                return FtlError{FtlError::InvalidArg,
                    std::string("missing value for ") + flag};
            }
            return Result<std::string>::ok(argv[++i]);
        };

        if (arg == "--attr" || arg == "--locale" || arg == "--config") {
            auto v = flag_value(arg.c_str());
            if (v.is_err()) return std::move(v).error();
            if (arg == "--attr") opts.attribute = v.value();
            else if (arg == "--locale") opts.locale = v.value();
            else opts.config_path = v.value();
        } else if (arg.find('=') != std::string::npos && positional.size() >= 2) {
            auto eq = arg.find('=');
            opts.args[arg.substr(0, eq)] = parse_arg_value(arg.substr(eq + 1));
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        return FtlError{FtlError::InvalidArg,
            "expected a file and a message id",
            "usage: ftl-format <file.ftl> <message-id> [name=value ...] "
            "[--attr A] [--locale L] [--config path]"};
    }
    opts.file = positional[0];
    opts.message_id = positional[1];
    return Result<Options>::ok(std::move(opts));
}

static Result<Config> load_config(const Options& opts) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto r = Config::load(global_path);
        if (r.is_err()) return std::move(r).error();
        global = std::move(r).value();
    }

    std::optional<Config> project;
    if (opts.config_path) {
        auto r = Config::load(*opts.config_path);
        if (r.is_err()) return std::move(r).error();
        project = std::move(r).value();
    }

    return Result<Config>::ok(Config::effective(global, project, std::nullopt));
}

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 1;
    }

    auto cfg = load_config(opts.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    cfg.value().apply_logging();

    auto source = read_text_file(opts.value().file, "FTL file");
    if (source.is_err()) {
        std::cerr << source.error().format() << "\n";
        return 1;
    }

    std::string locale = opts.value().locale.value_or(cfg.value().locale);
    log::debug("formatting '%s' for locale %s",
               opts.value().message_id.c_str(), locale.c_str());

    Bundle bundle(locale, cfg.value().bundle_options());
    bundle.add_resource(source.value());

    auto result = bundle.format_pattern(opts.value().message_id, opts.value().args,
                                        opts.value().attribute);
    std::cout << result.value << "\n";

    for (const auto& d : result.errors) {
        std::cerr << d.format(source.value()) << "\n";
    }
    return result.ok() ? 0 : 2;
}
