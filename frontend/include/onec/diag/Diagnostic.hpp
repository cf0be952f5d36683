// frontend/include/onec/diag/Diagnostic.hpp
#pragma once
#include <onec/text/Span.hpp>
#include <onec/diag/DiagCode.hpp>

#include <string>
#include <string_view>
#include <vector>


namespace onec::diag {

    class Diagnostic {
    public:
        Diagnostic(Severity severity, Code code, Span span)
            : severity_(severity), code_(code), span_(span) {}

        void add_arg(std::string_view s) {  args_.emplace_back(s);  }

        Severity severity() const   {  return severity_;        }
        Code code() const           {  return code_;            }
        Stage stage() const         {  return stage_of(code_);  }
        Span span() const           {  return span_;            }
        const std::vector<std::string>& args() const {  return args_;  }

    private:
        Severity severity_{Severity::kError};
        Code code_{Code::kUnexpectedToken};
        Span span_{};
        std::vector<std::string> args_;
    };

    class Bag {
    public:
        void add(Diagnostic d) {
            if (d.severity() == Severity::kError) ++error_count_;
            if (d.severity() == Severity::kFatal) ++fatal_count_;
            diags_.push_back(std::move(d));
        }

        bool has_error() const {
            return error_count_ + fatal_count_ != 0;
        }

        bool has_code(Code c) const {
            for (const auto& d : diags_) {
                if (d.code() == c) return true;
            }
            return false;
        }

        /// @brief 해당 단계에서 error 이상의 진단이 있는지
        bool has_error_in(Stage s) const {
            for (const auto& d : diags_) {
                if (d.severity() != Severity::kWarning && d.stage() == s) return true;
            }
            return false;
        }

        const std::vector<Diagnostic>& diags() const {  return diags_;  }

        uint32_t error_count() const {  return error_count_;  }

    private:
        std::vector<Diagnostic> diags_;
        uint32_t error_count_ = 0;
        uint32_t fatal_count_ = 0;
    };

} // namespace onec::diag
