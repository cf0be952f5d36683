// frontend/include/onec/tyck/TypeEnv.hpp
#pragma once
#include <onec/ty/Type.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace onec::tyck {

    // unordered_map for string_view
    struct SvHash {
        size_t operator()(std::string_view s) const noexcept {
            // FNV-1a
            size_t h = 1469598103934665603ull;
            for (unsigned char c : s) {
                h ^= (size_t)c;
                h *= 1099511628211ull;
            }
            return h;
        }
    };

    struct Scope {
        uint32_t parent = 0xFFFF'FFFFu;
        std::unordered_map<std::string_view, ty::TypeId, SvHash> table;
    };

    /// @brief 이름 -> 타입 스코프 체인.
    /// @details 자식 스코프의 바인딩이 부모를 가린다. 블록 검사가 끝나면 스코프를 버린다.
    class TypeEnv {
    public:
        static constexpr uint32_t kNoScope = 0xFFFF'FFFFu;

        TypeEnv() {
            // [0] 글로벌 스코프
            scopes_.emplace_back();
        }

        uint32_t current_scope() const { return static_cast<uint32_t>(scopes_.size() - 1); }

        uint32_t push_scope() {
            Scope s{};
            s.parent = current_scope();
            scopes_.push_back(std::move(s));
            return current_scope();
        }

        // 글로벌은 pop 금지
        void pop_scope() {
            if (scopes_.size() <= 1) return;
            scopes_.pop_back();
        }

        /// @brief 현재 스코프에 (재)정의. 선언/재사용 구분이 없다.
        void define(std::string_view name, ty::TypeId t) {
            scopes_.back().table[name] = t;
        }

        void define_global(std::string_view name, ty::TypeId t) {
            scopes_.front().table[name] = t;
        }

        std::optional<ty::TypeId> lookup(std::string_view name) const {
            uint32_t s = current_scope();
            while (s != kNoScope) {
                const auto& m = scopes_[s].table;
                auto it = m.find(name);
                if (it != m.end()) return it->second;
                s = scopes_[s].parent;
            }
            return std::nullopt;
        }

    private:
        std::vector<Scope> scopes_;
    };

    /// @brief 스코프 push/pop RAII 가드
    class ScopeGuard {
    public:
        explicit ScopeGuard(TypeEnv& env) : env_(env) { env_.push_scope(); }
        ~ScopeGuard() { env_.pop_scope(); }

        ScopeGuard(const ScopeGuard&) = delete;
        ScopeGuard& operator=(const ScopeGuard&) = delete;

    private:
        TypeEnv& env_;
    };

} // namespace onec::tyck
