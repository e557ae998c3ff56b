#include "taskpad/hotkeys.hpp"

#include "taskpad/options.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include <tvision/util.h>

namespace nlohmann
{
template <>
struct adl_serializer<TKey>
{
    static void to_json(json &j, const TKey &key)
    {
        j = json{{"code", key.code}, {"mods", key.mods}};
    }

    static void from_json(const json &j, TKey &key)
    {
        key = TKey(j.at("code").get<ushort>(), j.at("mods").get<ushort>());
    }
};
} // namespace nlohmann

namespace taskpad::hotkeys
{

namespace
{

struct SchemeData
{
    std::string id;
    std::string displayName;
    std::string description;
    std::vector<KeyBinding> bindings;
};

std::vector<SchemeData> gSchemes;
std::string gActiveId;
std::string gPreferredScheme;
std::string gCustomBase;
std::unordered_map<std::uint16_t, std::string> gLabels;

constexpr std::string_view kCustomSchemeId = "custom";

std::string platformDefaultSchemeId()
{
#ifdef __APPLE__
    return "mac";
#else
    return "linux";
#endif
}

std::filesystem::path configFilePath()
{
    if (const char *overridePath = std::getenv("TASKPAD_HOTKEYS_CONFIG"))
    {
        if (overridePath[0] != '\0')
            return std::filesystem::path(overridePath);
    }
    return taskpad::config::OptionRegistry::configRoot() / "hotkeys.json";
}

SchemeData *findScheme(std::string_view id)
{
    auto it = std::find_if(gSchemes.begin(), gSchemes.end(), [&](const SchemeData &scheme) {
        return scheme.id == id;
    });
    return it != gSchemes.end() ? &*it : nullptr;
}

SchemeData &ensureScheme(std::string_view id)
{
    if (SchemeData *existing = findScheme(id))
        return *existing;
    SchemeData data;
    data.id = std::string(id);
    data.displayName = std::string(id);
    gSchemes.push_back(std::move(data));
    return gSchemes.back();
}

SchemeData *activeSchemeData()
{
    if (gActiveId.empty() && !gSchemes.empty())
        gActiveId = gSchemes.front().id;
    return findScheme(gActiveId);
}

void upsertBinding(SchemeData &scheme, KeyBinding binding)
{
    if (binding.command == 0)
        return;
    if (binding.display.empty())
        binding.display = formatKey(binding.key);
    auto it = std::find_if(scheme.bindings.begin(), scheme.bindings.end(), [&](const KeyBinding &existing) {
        return existing.command == binding.command;
    });
    if (it != scheme.bindings.end())
        *it = std::move(binding);
    else
        scheme.bindings.push_back(std::move(binding));
}

SchemeData &ensureCustomScheme()
{
    if (SchemeData *existing = findScheme(kCustomSchemeId))
        return *existing;
    std::string base = gCustomBase.empty() ? std::string(activeScheme()) : gCustomBase;
    std::vector<KeyBinding> seed;
    if (SchemeData *template_ = findScheme(base))
        seed = template_->bindings;
    gCustomBase = base;
    SchemeData &custom = ensureScheme(kCustomSchemeId);
    custom.displayName = "Custom";
    custom.description = "User-defined hotkey scheme";
    custom.bindings = std::move(seed);
    return custom;
}

bool loadConfiguration(const std::filesystem::path &path)
{
    std::ifstream file(path);
    if (!file)
        return false;

    nlohmann::json j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return false;

    if (j.contains("preferred_scheme") && j["preferred_scheme"].is_string())
        gPreferredScheme = j["preferred_scheme"].get<std::string>();
    if (j.contains("custom_scheme_base") && j["custom_scheme_base"].is_string())
        gCustomBase = j["custom_scheme_base"].get<std::string>();

    if (j.contains("custom_scheme_bindings") && j["custom_scheme_bindings"].is_object())
    {
        SchemeData &custom = ensureCustomScheme();
        const nlohmann::json &bindings = j["custom_scheme_bindings"];
        for (auto it = bindings.begin(); it != bindings.end(); ++it)
        {
            try
            {
                KeyBinding binding;
                binding.command = static_cast<std::uint16_t>(std::stoul(it.key()));
                binding.key = it.value().at("key").get<TKey>();
                binding.display = it.value().value("display", std::string());
                upsertBinding(custom, std::move(binding));
            }
            catch (const std::exception &)
            {
                // Malformed entries keep the template binding.
            }
        }
    }
    return true;
}

} // namespace

void registerSchemes(std::span<const Scheme> schemes)
{
    for (const auto &scheme : schemes)
    {
        SchemeData &data = ensureScheme(scheme.id);
        if (!scheme.displayName.empty())
            data.displayName = std::string(scheme.displayName);
        if (!scheme.description.empty())
            data.description = std::string(scheme.description);
        for (const auto &binding : scheme.bindings)
            upsertBinding(data, binding);
    }
}

void registerDefaultSchemes()
{
    // Implemented in default_schemes.cpp.
    extern void registerBuiltinHotkeySchemes();
    static bool registered = false;
    if (registered)
        return;
    registered = true;
    registerBuiltinHotkeySchemes();
    setActiveScheme(platformDefaultSchemeId());
}

void init()
{
    registerDefaultSchemes();
    loadCustomBindings();
    if (!gPreferredScheme.empty())
        setActiveScheme(gPreferredScheme);
    if (const char *scheme = std::getenv("TASKPAD_HOTKEY_SCHEME"))
        setActiveScheme(scheme);
}

bool setActiveScheme(std::string_view id)
{
    if (id.empty() || !findScheme(id))
        return false;
    gActiveId = std::string(id);
    return true;
}

std::string_view activeScheme()
{
    activeSchemeData();
    return gActiveId;
}

std::string defaultSchemeId()
{
    return platformDefaultSchemeId();
}

std::vector<std::pair<std::string, std::string>> availableSchemes()
{
    std::vector<std::pair<std::string, std::string>> result;
    result.reserve(gSchemes.size());
    for (const auto &scheme : gSchemes)
        result.emplace_back(scheme.id, scheme.displayName);
    return result;
}

const KeyBinding *lookup(std::uint16_t command) noexcept
{
    SchemeData *scheme = activeSchemeData();
    if (!scheme)
        return nullptr;
    for (const auto &binding : scheme->bindings)
    {
        if (binding.command == command)
            return &binding;
    }
    return nullptr;
}

TKey key(std::uint16_t command) noexcept
{
    if (const auto *binding = lookup(command))
        return binding->key;
    return {};
}

std::string displayText(std::uint16_t command)
{
    if (const auto *binding = lookup(command))
        return binding->display;
    return {};
}

std::string statusLabel(std::uint16_t command, std::string_view action)
{
    const auto *binding = lookup(command);
    if (!binding || binding->display.empty())
        return std::string(action);

    std::string label;
    label.reserve(binding->display.size() + action.size() + 4);
    label.append("~");
    label.append(binding->display);
    label.append("~ ");
    label.append(action);
    return label;
}

void configureStatusItem(TStatusItem &item, std::string_view action)
{
    if (const auto *binding = lookup(item.command))
    {
        item.keyCode = binding->key.code;
        auto label = statusLabel(item.command, action);
        delete[] item.text;
        item.text = newStr(label.c_str());
    }
}

void configureMenuItem(TMenuItem &item)
{
    if (!item.command)
        return;
    if (const auto *binding = lookup(item.command))
    {
        item.keyCode = binding->key.code;
        delete[] (char *)item.param;
        item.param = newStr(binding->display.c_str());
    }
}

void applyCommandLineScheme(int &argc, char **argv)
{
    int writeIndex = 1;
    for (int readIndex = 1; readIndex < argc; ++readIndex)
    {
        std::string_view arg(argv[readIndex]);
        if (arg.rfind("--hotkeys=", 0) == 0)
        {
            setActiveScheme(arg.substr(10));
            continue;
        }
        if (arg == "--hotkeys")
        {
            if (readIndex + 1 < argc)
            {
                setActiveScheme(argv[readIndex + 1]);
                ++readIndex;
            }
            continue;
        }
        argv[writeIndex++] = argv[readIndex];
    }
    argc = writeIndex;
    if (argv)
        argv[writeIndex] = nullptr;
}

void registerCommandLabels(std::span<const CommandLabel> labels)
{
    for (const auto &entry : labels)
    {
        if (entry.command != 0)
            gLabels[entry.command] = std::string(entry.label);
    }
}

std::string commandLabel(std::uint16_t command)
{
    auto it = gLabels.find(command);
    if (it == gLabels.end())
        return {};
    return it->second;
}

bool loadCustomBindings()
{
    std::error_code ec;
    const std::filesystem::path path = configFilePath();
    if (!std::filesystem::exists(path, ec))
        return false;
    return loadConfiguration(path);
}

std::string formatKey(TKey key)
{
    const bool ctrl = (key.mods & kbCtrlShift) != 0;
    const bool alt = (key.mods & kbAltShift) != 0;
    const bool shift = (key.mods & kbShift) != 0;

    std::string base;
    switch (key.code)
    {
    case kbEnter:
        base = "Enter";
        break;
    case kbEsc:
        base = "Esc";
        break;
    case kbTab:
        base = "Tab";
        break;
    case kbBack:
        base = "Backspace";
        break;
    case kbDel:
        base = "Del";
        break;
    default:
        if (key.code >= kbF1 && key.code <= kbF10)
            base = "F" + std::to_string(((key.code - kbF1) >> 8) + 1);
        else if (key.code >= 32 && key.code < 127)
            base.assign(1, static_cast<char>(std::toupper(static_cast<unsigned char>(key.code))));
        break;
    }

    if (base.empty())
    {
        std::ostringstream oss;
        oss << "0x" << std::hex << std::uppercase << key.code;
        base = oss.str();
    }

    std::string out;
    if (ctrl)
        out += "Ctrl-";
    if (alt)
        out += "Alt-";
    if (shift)
        out += "Shift-";
    out += base;
    return out;
}

} // namespace taskpad::hotkeys
