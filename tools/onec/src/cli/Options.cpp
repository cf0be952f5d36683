// tools/onec/src/cli/Options.cpp
#include "Options.hpp"

#include <onec/os/File.hpp>

#include <charconv>
#include <string>
#include <string_view>
#include <vector>


namespace onec::cli {

    namespace {

        /// @brief 음이 아닌 10진 정수를 파싱한다. 실패하면 false.
        bool parse_uint(std::string_view s, uint32_t& out) {
            if (s.empty()) return false;
            uint32_t v = 0;
            const auto r = std::from_chars(s.data(), s.data() + s.size(), v);
            if (r.ec != std::errc{} || r.ptr != s.data() + s.size()) return false;
            out = v;
            return true;
        }

        void set_error(Options& opt, std::string msg) {
            if (!opt.ok) return;  // 첫 오류만 보고
            opt.ok = false;
            opt.error = std::move(msg);
        }

    } // namespace

    void print_usage(std::ostream& os) {
        os
            << "onec <file.one> [options]\n"
            << "\n"
            << "Options:\n"
            << "  -o <path>           output bytecode file (default: <file>.1bc)\n"
            << "  -v                  print stage progress\n"
            << "  -d                  dump tokens and AST\n"
            << "  -t                  print disassembly\n"
            << "  --lang en|ko        diagnostic language\n"
            << "  --context N         context lines around diagnostics (default: 2)\n"
            << "  --entry NAME        entry point function (default: main)\n"
            << "  --version\n";
    }

    Options parse_options(int argc, char** argv) {
        Options opt{};

        if (argc <= 1) {
            opt.mode = Mode::kUsage;
            return opt;
        }

        std::vector<std::string_view> args;
        args.reserve(static_cast<size_t>(argc - 1));
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

        for (auto a : args) {
            if (a == "--version") {
                opt.mode = Mode::kVersion;
                return opt;
            }
        }

        for (size_t i = 0; i < args.size() && opt.ok; ++i) {
            const std::string_view a = args[i];

            // 값을 하나 받는 옵션
            auto take_value = [&](std::string_view& out) -> bool {
                if (i + 1 >= args.size()) {
                    set_error(opt, std::string(a) + " requires a value");
                    return false;
                }
                out = args[++i];
                return true;
            };

            if (a == "-v") { opt.verbose = true; continue; }
            if (a == "-d") { opt.dump = true; continue; }
            if (a == "-t") { opt.disasm = true; continue; }

            if (a == "-o") {
                std::string_view v;
                if (take_value(v)) opt.output_path = std::string(v);
                continue;
            }

            if (a == "--lang") {
                std::string_view v;
                if (!take_value(v)) continue;
                if (v == "en") opt.lang = diag::Language::kEn;
                else if (v == "ko") opt.lang = diag::Language::kKo;
                else set_error(opt, "--lang must be 'en' or 'ko'");
                continue;
            }

            if (a == "--context") {
                std::string_view v;
                if (!take_value(v)) continue;
                if (!parse_uint(v, opt.context_lines)) {
                    set_error(opt, "--context requires a non-negative integer");
                }
                continue;
            }

            if (a == "--entry") {
                std::string_view v;
                if (!take_value(v)) continue;
                if (v.empty()) set_error(opt, "--entry requires a function name");
                else opt.entry_point = std::string(v);
                continue;
            }

            if (a.size() > 1 && a[0] == '-') {
                set_error(opt, "unknown option: " + std::string(a));
                continue;
            }

            if (!opt.input_path.empty()) {
                set_error(opt, "multiple input files: " + opt.input_path + ", " + std::string(a));
                continue;
            }
            opt.input_path = std::string(a);
        }

        if (!opt.ok) return opt;

        if (opt.input_path.empty()) {
            set_error(opt, "no input file");
            return opt;
        }

        opt.mode = Mode::kCompile;
        return opt;
    }

    std::string resolved_output_path(const Options& opt) {
        if (!opt.output_path.empty()) return opt.output_path;
        return replace_extension(opt.input_path, ".1bc");
    }

} // namespace onec::cli
