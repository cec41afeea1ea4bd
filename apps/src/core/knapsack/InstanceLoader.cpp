#include "InstanceLoader.h"

#include "core/LoggingChannels.h"

#include <charconv>
#include <fstream>
#include <sstream>
#include <vector>

namespace KnapEvo {

namespace {

using InstanceResult = Result<KnapsackInstance, std::string>;

struct Line {
    int number = 0;
    std::string text;
};

std::vector<std::string> splitFields(const std::string& text)
{
    std::vector<std::string> fields;
    std::istringstream stream(text);
    std::string field;
    while (stream >> field) {
        fields.push_back(field);
    }
    return fields;
}

bool parseUnsigned(const std::string& field, uint64_t& out)
{
    const char* begin = field.data();
    const char* end = field.data() + field.size();
    const auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc() && ptr == end;
}

std::string where(const std::string& sourceName, const Line& line)
{
    return sourceName + ":" + std::to_string(line.number);
}

} // namespace

Result<KnapsackInstance, std::string> loadInstanceFromFile(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return InstanceResult::error("Cannot open instance file: " + path.string());
    }

    std::stringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        return InstanceResult::error("Error reading instance file: " + path.string());
    }

    LOG_INFO(Instance, "Loading knapsack instance from {}", path.string());
    return loadInstanceFromString(contents.str(), path.string());
}

Result<KnapsackInstance, std::string> loadInstanceFromString(
    const std::string& text, const std::string& sourceName)
{
    std::vector<Line> lines;
    {
        std::istringstream stream(text);
        std::string raw;
        int number = 0;
        while (std::getline(stream, raw)) {
            number++;
            if (raw.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }
            lines.push_back(Line{ .number = number, .text = raw });
        }
    }

    if (lines.empty()) {
        return InstanceResult::error("Instance " + sourceName + " is empty");
    }

    const auto countFields = splitFields(lines[0].text);
    uint64_t itemCount = 0;
    if (countFields.size() != 1 || !parseUnsigned(countFields[0], itemCount)) {
        return InstanceResult::error(
            where(sourceName, lines[0]) + ": expected item count, got '" + lines[0].text + "'");
    }

    if (lines.size() - 1 < itemCount) {
        return InstanceResult::error(
            sourceName + ": expected " + std::to_string(itemCount) + " item lines but found "
            + std::to_string(lines.size() - 1)
            + "; is the item count on the first line correct?");
    }

    std::vector<Item> items;
    items.reserve(itemCount);
    for (uint64_t n = 0; n < itemCount; ++n) {
        const Line& line = lines[n + 1];
        const auto fields = splitFields(line.text);
        if (fields.size() != 3) {
            return InstanceResult::error(
                where(sourceName, line) + ": item line '" + line.text
                + "' should have 3 whitespace separated fields");
        }

        Item item;
        if (!parseUnsigned(fields[0], item.id) || !parseUnsigned(fields[1], item.value)
            || !parseUnsigned(fields[2], item.weight)) {
            return InstanceResult::error(
                where(sourceName, line) + ": item line '" + line.text
                + "' must contain non-negative integers");
        }
        items.push_back(item);
    }

    const size_t capacityIndex = static_cast<size_t>(itemCount) + 1;
    if (capacityIndex >= lines.size()) {
        return InstanceResult::error(
            sourceName + ": missing capacity line after " + std::to_string(itemCount)
            + " items; the item count may be wrong");
    }

    const Line& capacityLine = lines[capacityIndex];
    const auto capacityFields = splitFields(capacityLine.text);
    uint64_t capacity = 0;
    if (capacityFields.size() != 1 || !parseUnsigned(capacityFields[0], capacity)) {
        return InstanceResult::error(
            where(sourceName, capacityLine) + ": expected capacity, got '" + capacityLine.text
            + "'");
    }

    if (capacityIndex + 1 < lines.size()) {
        LOG_WARN(
            Instance,
            "{}: ignoring {} trailing line(s) after the capacity",
            sourceName,
            lines.size() - capacityIndex - 1);
    }

    auto instance = KnapsackInstance::create(std::move(items), capacity);
    if (instance.isError()) {
        return InstanceResult::error(sourceName + ": " + instance.errorValue());
    }

    LOG_INFO(
        Instance,
        "Loaded {} items, capacity {} from {}",
        instance.value().getItemCount(),
        capacity,
        sourceName);
    return instance;
}

} // namespace KnapEvo
