#include <parity/harness/skip_registry.hpp>
#include <parity/io/byte_source.hpp>

#include <fmt/core.h>

namespace parity::harness {

namespace {

auto trim(std::string_view text) -> std::string_view {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

}  // namespace

SkipRegistry::SkipRegistry(std::initializer_list<SkipEntry> entries) {
    for (const auto& entry : entries) {
        add(entry.name, entry.reason);
    }
}

auto SkipRegistry::parse(std::string_view text) -> Expected<SkipRegistry> {
    SkipRegistry registry;
    std::size_t line_no = 0;
    while (!text.empty()) {
        const auto eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);
        line_no += 1;

        std::string_view content = trim(line);
        if (content.empty() || content.front() == '#') {
            continue;
        }
        const auto tab = content.find('\t');
        if (tab == std::string_view::npos) {
            return std::unexpected(make_error(ErrorKind::Decode,
                                              "expected <name><TAB><reason>", line_no));
        }
        std::string_view name = trim(content.substr(0, tab));
        std::string_view reason = trim(content.substr(tab + 1));
        if (name.empty() || reason.empty()) {
            return std::unexpected(
                make_error(ErrorKind::Decode, "skip entry needs a name and a reason", line_no));
        }
        if (registry.find(name) != nullptr) {
            return std::unexpected(make_error(
                ErrorKind::Decode, fmt::format("case '{}' is listed twice", name), line_no));
        }
        registry.add(std::string(name), std::string(reason));
    }
    return registry;
}

auto SkipRegistry::load(const std::filesystem::path& path) -> Expected<SkipRegistry> {
    auto text = io::read_file(path);
    if (!text.has_value()) {
        return std::unexpected(std::move(text.error()));
    }
    auto registry = parse(*text);
    if (!registry.has_value()) {
        auto err = std::move(registry.error());
        err.message = fmt::format("{}: {}", path.string(), err.message);
        return std::unexpected(std::move(err));
    }
    return registry;
}

void SkipRegistry::add(std::string name, std::string reason) {
    entries_.insert_or_assign(std::move(name), std::move(reason));
}

auto SkipRegistry::find(std::string_view name) const -> const std::string* {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

}  // namespace parity::harness
