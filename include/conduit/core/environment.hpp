#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace conduit::core {

// Deployment environment. Decided once at startup and handed to whatever needs it.
class Environment {
public:
    enum class Kind { Production, Development, Testing, Custom };

    static Environment production() { return Environment{Kind::Production, "production"}; }
    static Environment development() { return Environment{Kind::Development, "development"}; }
    static Environment testing() { return Environment{Kind::Testing, "testing"}; }
    static Environment custom(std::string name) { return Environment{Kind::Custom, std::move(name)}; }

    // "prod"/"production", "dev"/"development"/"local" (or empty), "test"/"testing";
    // anything else is a custom environment of that name.
    static Environment parse(std::string_view name);

    Kind kind() const { return kind_; }
    const std::string& name() const { return name_; }
    bool is_production() const { return kind_ == Kind::Production; }

    friend bool operator==(const Environment& lhs, const Environment& rhs)
    {
        return lhs.kind_ == rhs.kind_ && lhs.name_ == rhs.name_;
    }

private:
    Environment(Kind kind, std::string name) : kind_(kind), name_(std::move(name)) {}

    Kind kind_;
    std::string name_;
};

} // namespace conduit::core
