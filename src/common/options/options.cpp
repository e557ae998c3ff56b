#include "taskpad/options.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>

namespace taskpad::config
{
namespace
{
std::string lowered(const std::string &value)
{
    std::string lower;
    lower.reserve(value.size());
    for (char ch : value)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return lower;
}

bool parseBool(const std::string &value, bool fallback)
{
    const std::string lower = lowered(value);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on")
        return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off")
        return false;
    return fallback;
}

std::int64_t parseInteger(const std::string &value, std::int64_t fallback)
{
    if (value.empty())
        return fallback;
    char *end = nullptr;
    const long long parsed = std::strtoll(value.c_str(), &end, 0);
    if (end != value.c_str() + value.size())
        return fallback;
    return static_cast<std::int64_t>(parsed);
}

OptionValue fromJson(const OptionDefinition &definition, const nlohmann::json &node)
{
    if (node.is_boolean())
        return OptionValue(node.get<bool>());
    if (node.is_number_integer())
        return OptionValue(node.get<std::int64_t>());
    if (node.is_string())
        return OptionValue(node.get<std::string>());
    return definition.defaultValue;
}

nlohmann::json toJson(OptionKind kind, const OptionValue &value)
{
    switch (kind)
    {
    case OptionKind::Boolean:
        return value.toBool();
    case OptionKind::Integer:
        return value.toInteger();
    case OptionKind::String:
        return value.toString();
    }
    return nullptr;
}

std::filesystem::path detectConfigRoot()
{
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"))
    {
        if (xdg[0] != '\0')
            return std::filesystem::path(xdg) / "taskpad";
    }
    if (const char *home = std::getenv("HOME"))
    {
        if (home[0] != '\0')
            return std::filesystem::path(home) / ".config" / "taskpad";
    }
    return std::filesystem::path(".config") / "taskpad";
}

} // namespace

OptionValue::OptionValue(bool value)
    : value(value)
{
}

OptionValue::OptionValue(std::int64_t value)
    : value(value)
{
}

OptionValue::OptionValue(std::string value)
    : value(std::move(value))
{
}

OptionValue::OptionValue(const char *value)
    : value(std::string(value ? value : ""))
{
}

bool OptionValue::isNull() const noexcept
{
    return std::holds_alternative<std::monostate>(value);
}

bool OptionValue::holds(OptionKind kind) const noexcept
{
    switch (kind)
    {
    case OptionKind::Boolean:
        return std::holds_alternative<bool>(value);
    case OptionKind::Integer:
        return std::holds_alternative<std::int64_t>(value);
    case OptionKind::String:
        return std::holds_alternative<std::string>(value);
    }
    return false;
}

bool OptionValue::toBool(bool fallback) const noexcept
{
    if (auto *b = std::get_if<bool>(&value))
        return *b;
    if (auto *i = std::get_if<std::int64_t>(&value))
        return *i != 0;
    if (auto *s = std::get_if<std::string>(&value))
        return parseBool(*s, fallback);
    return fallback;
}

std::int64_t OptionValue::toInteger(std::int64_t fallback) const noexcept
{
    if (auto *i = std::get_if<std::int64_t>(&value))
        return *i;
    if (auto *b = std::get_if<bool>(&value))
        return *b ? 1 : 0;
    if (auto *s = std::get_if<std::string>(&value))
        return parseInteger(*s, fallback);
    return fallback;
}

std::string OptionValue::toString(const std::string &fallback) const
{
    if (auto *s = std::get_if<std::string>(&value))
        return *s;
    if (auto *b = std::get_if<bool>(&value))
        return *b ? "true" : "false";
    if (auto *i = std::get_if<std::int64_t>(&value))
        return std::to_string(*i);
    return fallback;
}

OptionRegistry::OptionRegistry(std::string appId)
    : id(std::move(appId))
{
}

void OptionRegistry::registerOption(const OptionDefinition &definition)
{
    definitions[definition.key] = definition;
    if (auto it = overrides.find(definition.key); it != overrides.end())
        it->second = coerce(definition, it->second);
}

bool OptionRegistry::hasOption(const std::string &key) const noexcept
{
    return definitions.count(key) != 0;
}

void OptionRegistry::set(const std::string &key, const OptionValue &value)
{
    if (const OptionDefinition *definition = findDefinition(key))
        overrides[key] = coerce(*definition, value);
}

void OptionRegistry::reset(const std::string &key)
{
    overrides.erase(key);
}

OptionValue OptionRegistry::get(const std::string &key) const
{
    if (auto it = overrides.find(key); it != overrides.end())
        return it->second;
    if (const OptionDefinition *definition = findDefinition(key))
        return definition->defaultValue;
    return OptionValue();
}

bool OptionRegistry::getBool(const std::string &key, bool fallback) const
{
    return get(key).toBool(fallback);
}

std::int64_t OptionRegistry::getInteger(const std::string &key, std::int64_t fallback) const
{
    return get(key).toInteger(fallback);
}

std::string OptionRegistry::getString(const std::string &key, const std::string &fallback) const
{
    return get(key).toString(fallback);
}

int OptionRegistry::applyEnvironment()
{
    int applied = 0;
    for (const auto &[key, definition] : definitions)
    {
        const std::string name = environmentName(key);
        if (const char *raw = std::getenv(name.c_str()))
        {
            overrides[key] = coerce(definition, OptionValue(std::string(raw)));
            ++applied;
        }
    }
    return applied;
}

bool OptionRegistry::loadFromFile(const std::filesystem::path &filePath)
{
    std::ifstream in(filePath);
    if (!in)
        return false;

    nlohmann::json data = nlohmann::json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_object())
        return false;

    for (auto it = data.begin(); it != data.end(); ++it)
    {
        const OptionDefinition *definition = findDefinition(it.key());
        if (!definition || it.value().is_null())
            continue;
        overrides[it.key()] = coerce(*definition, fromJson(*definition, it.value()));
    }
    return true;
}

bool OptionRegistry::saveToFile(const std::filesystem::path &filePath) const
{
    nlohmann::json data = nlohmann::json::object();
    for (const auto &[key, definition] : definitions)
        data[key] = toJson(definition.kind, get(key));

    std::error_code ec;
    if (filePath.has_parent_path())
        std::filesystem::create_directories(filePath.parent_path(), ec);

    std::ofstream out(filePath);
    if (!out)
        return false;
    out << data.dump(2) << std::endl;
    return static_cast<bool>(out);
}

bool OptionRegistry::loadDefaults()
{
    std::error_code ec;
    const std::filesystem::path path = defaultOptionsPath();
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadFromFile(path);
}

std::filesystem::path OptionRegistry::defaultOptionsPath() const
{
    return configRoot() / id / "defaults.json";
}

std::vector<OptionDefinition> OptionRegistry::listRegisteredOptions() const
{
    std::vector<OptionDefinition> result;
    result.reserve(definitions.size());
    for (const auto &[key, definition] : definitions)
        result.push_back(definition);
    std::sort(result.begin(), result.end(), [](const OptionDefinition &a, const OptionDefinition &b) {
        return a.key < b.key;
    });
    return result;
}

std::filesystem::path OptionRegistry::configRoot()
{
    static const std::filesystem::path root = detectConfigRoot();
    return root;
}

std::string OptionRegistry::environmentName(const std::string &key)
{
    std::string name = "TASKPAD_";
    for (char ch : key)
    {
        if (ch == '-' || ch == '.')
            name.push_back('_');
        else
            name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    return name;
}

const OptionDefinition *OptionRegistry::findDefinition(const std::string &key) const
{
    auto it = definitions.find(key);
    if (it == definitions.end())
        return nullptr;
    return &it->second;
}

OptionValue OptionRegistry::coerce(const OptionDefinition &definition, const OptionValue &value)
{
    switch (definition.kind)
    {
    case OptionKind::Boolean:
        return OptionValue(value.toBool(definition.defaultValue.toBool()));
    case OptionKind::Integer:
        return OptionValue(value.toInteger(definition.defaultValue.toInteger()));
    case OptionKind::String:
        return OptionValue(value.toString(definition.defaultValue.toString()));
    }
    return value;
}

} // namespace taskpad::config
