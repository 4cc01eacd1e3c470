// core/include/convco/syntax/TypeProfile.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string_view>


namespace convco::syntax {

    /// @brief 허용되는 커밋 타입 키워드 집합
    enum class TypeProfile : uint8_t {
        kMinimal,       // feat, fix
        kConventional,  // build, chore, ci, docs, feat, fix, perf, refactor, revert, style, test
        kFalco,         // build, chore, ci, docs, feat, fix, new, perf, revert, rule, test, update
    };

    std::string_view profile_name(TypeProfile p);

    /// @brief "minimal" | "conventional" | "falco" 를 해석한다. 그 외는 nullopt.
    std::optional<TypeProfile> parse_profile(std::string_view s);

} // namespace convco::syntax
