#include "sshmcp/descriptor.hpp"
#include "sshmcp/logging.hpp"
#include <sys/stat.h>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <optional>
#include <sstream>
#include <vector>

namespace sshmcp {

namespace {

std::string trim(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string(s.substr(start, end - start));
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) nl = text.size();
        std::string line(text.substr(pos, nl - pos));
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        pos = nl + 1;
    }
    return lines;
}

void add_tag(std::vector<std::string>& tags, const std::string& raw) {
    std::string tag = trim(raw);
    if (tag.empty()) return;
    if (std::find(tags.begin(), tags.end(), tag) == tags.end()) {
        tags.push_back(std::move(tag));
    }
}

std::vector<std::string> parse_tag_list(const std::string& value) {
    std::vector<std::string> tags;
    std::string current;
    for (char c : value) {
        if (c == ',') {
            add_tag(tags, current);
            current.clear();
        } else {
            current += c;
        }
    }
    add_tag(tags, current);
    return tags;
}

/// "Key: value" where Key starts upper-case and holds only letters and spaces.
std::optional<std::pair<std::string, std::string>> split_key_line(const std::string& line) {
    if (line.empty() || !std::isupper(static_cast<unsigned char>(line[0]))) return std::nullopt;
    size_t colon = line.find(':');
    if (colon == std::string::npos) return std::nullopt;
    for (size_t i = 0; i < colon; ++i) {
        char c = line[i];
        if (!std::isalpha(static_cast<unsigned char>(c)) && c != ' ') return std::nullopt;
    }
    return std::make_pair(line.substr(0, colon), trim(std::string_view(line).substr(colon + 1)));
}

void set_schema(ToolDescriptor& d, const std::string& id, const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        logger()->debug("tool {} declares a schema that is not a JSON object", id);
        d.schema = nlohmann::json::object();
        d.schema_valid = false;
        return;
    }
    d.schema = std::move(parsed);
    d.schema_valid = true;
}

void apply_defaults(ToolDescriptor& d, const std::string& id) {
    if (!d.name.empty() && d.name != id) {
        logger()->debug("tool {} names itself '{}'; registry id is used", id, d.name);
    }
    d.name = id;
    if (d.description.empty()) d.description = DescriptorParser::DEFAULT_DESCRIPTION;
    if (d.author.empty()) d.author = DescriptorParser::DEFAULT_AUTHOR;
    if (d.version.empty()) d.version = DescriptorParser::DEFAULT_VERSION;
}

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

std::string modification_date(const std::filesystem::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return {};
    std::tm tm_buf{};
    localtime_r(&st.st_mtime, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf);
    return buf;
}

std::vector<std::string> string_list(const nlohmann::json& j) {
    std::vector<std::string> out;
    if (j.is_string()) {
        out.push_back(j.get<std::string>());
    } else if (j.is_array()) {
        for (const auto& item : j) {
            out.push_back(item.is_string() ? item.get<std::string>() : item.dump());
        }
    }
    return out;
}

} // anonymous namespace

nlohmann::json DescriptorParser::default_schema() {
    return nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}};
}

ToolDescriptor DescriptorParser::parse_header(const std::string& id, std::string_view source) {
    enum class Block { None, Args, Example, Schema };

    ToolDescriptor d;
    d.schema = default_schema();

    Block block = Block::None;
    std::string schema_text;
    bool schema_seen = false;
    bool schema_closed = false;

    auto lines = split_lines(source);
    size_t i = 0;
    if (!lines.empty() && lines[0].rfind("#!", 0) == 0) i = 1;

    for (; i < lines.size(); ++i) {
        const std::string& raw = lines[i];
        if (raw.empty() || raw[0] != '#') break;   // header ends at first non-comment line

        std::string body = raw.substr(1);
        if (!body.empty() && body[0] == ' ') body.erase(0, 1);

        if (block == Block::Schema) {
            if (trim(body) == "End Schema") {
                schema_closed = true;
                block = Block::None;
            } else {
                schema_text += body;
                schema_text += '\n';
            }
            continue;
        }

        std::string line = trim(body);
        if (line.empty()) {
            block = Block::None;
            continue;
        }

        auto kv = split_key_line(line);
        if (!kv) {
            if (block == Block::Args) d.args_doc.push_back(line);
            else if (block == Block::Example) d.examples.push_back(line);
            continue;
        }

        const auto& [key, value] = *kv;
        block = Block::None;
        if (key == "Tool") {
            // Names never contain " - ", so the first one ends the name
            size_t sep = value.find(" - ");
            if (sep == std::string::npos) {
                d.name = value;
            } else {
                d.name = trim(std::string_view(value).substr(0, sep));
                d.description = trim(std::string_view(value).substr(sep + 3));
            }
        } else if (key == "Description") {
            d.description = value;
        } else if (key == "Author") {
            d.author = value;
        } else if (key == "Version") {
            d.version = value;
        } else if (key == "Tags") {
            d.tags = parse_tag_list(value);
        } else if (key == "Args") {
            block = Block::Args;
            if (!value.empty()) d.args_doc.push_back(value);
        } else if (key == "Example" || key == "Examples") {
            block = Block::Example;
            if (!value.empty()) d.examples.push_back(value);
        } else if (key == "Schema") {
            block = Block::Schema;
            schema_seen = true;
            if (!value.empty()) {
                schema_text += value;
                schema_text += '\n';
            }
        }
        // other keys ("Requires sudo", ...) are informational only
    }

    if (schema_seen) {
        if (schema_closed) {
            set_schema(d, id, schema_text);
        } else {
            logger()->debug("tool {} has a Schema block without End Schema", id);
            d.schema = nlohmann::json::object();
            d.schema_valid = false;
        }
    }

    apply_defaults(d, id);
    return d;
}

ToolDescriptor DescriptorParser::parse_manifest(const std::string& id,
                                                const nlohmann::json& manifest) {
    ToolDescriptor d;
    d.schema = default_schema();
    if (!manifest.is_object()) {
        apply_defaults(d, id);
        return d;
    }

    auto str = [&manifest](const char* key) -> std::string {
        auto it = manifest.find(key);
        return (it != manifest.end() && it->is_string()) ? it->get<std::string>() : std::string();
    };

    d.name = str("name");
    d.description = str("description");
    d.author = str("author");
    d.version = str("version");

    if (manifest.contains("tags")) {
        const auto& tags = manifest.at("tags");
        if (tags.is_string()) {
            d.tags = parse_tag_list(tags.get<std::string>());
        } else {
            for (const auto& tag : string_list(tags)) add_tag(d.tags, tag);
        }
    }
    if (manifest.contains("args")) d.args_doc = string_list(manifest.at("args"));
    if (manifest.contains("examples")) d.examples = string_list(manifest.at("examples"));

    if (manifest.contains("schema")) {
        const auto& schema = manifest.at("schema");
        if (schema.is_object()) {
            d.schema = schema;
        } else if (schema.is_string()) {
            set_schema(d, id, schema.get<std::string>());
        } else {
            d.schema = nlohmann::json::object();
            d.schema_valid = false;
        }
    }

    apply_defaults(d, id);
    return d;
}

ToolDescriptor DescriptorParser::load(const ToolEntry& entry) {
    ToolDescriptor d;
    bool loaded = false;

    if (entry.manifest) {
        auto text = read_file(*entry.manifest);
        if (text) {
            auto manifest = nlohmann::json::parse(*text, nullptr, false);
            if (!manifest.is_discarded() && manifest.is_object()) {
                d = parse_manifest(entry.id, manifest);
                loaded = true;
            } else {
                logger()->warn("ignoring malformed manifest {}", entry.manifest->string());
            }
        }
    }

    if (!loaded) {
        auto source = read_file(entry.path);
        if (!source) {
            logger()->warn("cannot read tool source {}", entry.path.string());
            source = std::string();
        }
        d = parse_header(entry.id, *source);
    }

    d.created = modification_date(entry.path);
    return d;
}

} // namespace sshmcp
