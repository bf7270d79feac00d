#include "multipart.h"
#include <sstream>
#include <algorithm>
#include <cctype>

namespace scriptbox {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

std::vector<MultipartPart> MultipartParser::parse(
    const std::string& content_type,
    const std::string& body
) {
    std::vector<MultipartPart> parts;

    std::string boundary = extract_boundary(content_type);
    if (boundary.empty()) return parts;

    const std::string delimiter = "--" + boundary;

    size_t start = body.find(delimiter);
    if (start == std::string::npos) return parts;

    while (true) {
        start += delimiter.length();
        if (body.compare(start, 2, "--") == 0) {
            break;  // Closing delimiter
        }
        // Line break after the delimiter
        if (body.compare(start, 2, "\r\n") == 0) {
            start += 2;
        } else if (start < body.size() && body[start] == '\n') {
            start += 1;
        }

        size_t end = body.find(delimiter, start);
        if (end == std::string::npos) break;

        // The line break before the next delimiter belongs to it
        size_t content_end = end;
        if (content_end >= start + 2 && body.compare(content_end - 2, 2, "\r\n") == 0) {
            content_end -= 2;
        } else if (content_end > start && body[content_end - 1] == '\n') {
            content_end -= 1;
        }

        MultipartPart part = parse_part(body.substr(start, content_end - start));
        if (!part.name.empty()) {
            parts.push_back(std::move(part));
        }
        start = end;
    }

    return parts;
}

const MultipartPart* MultipartParser::find(const std::vector<MultipartPart>& parts,
                                           const std::string& name) {
    for (const auto& part : parts) {
        if (part.name == name) {
            return &part;
        }
    }
    return nullptr;
}

std::string MultipartParser::extract_boundary(const std::string& content_type) {
    const std::string boundary_prefix = "boundary=";
    size_t pos = content_type.find(boundary_prefix);
    if (pos == std::string::npos) return "";

    pos += boundary_prefix.length();
    size_t end = content_type.find(';', pos);
    if (end == std::string::npos) end = content_type.length();

    std::string boundary = content_type.substr(pos, end - pos);
    while (!boundary.empty() && std::isspace(static_cast<unsigned char>(boundary.back()))) {
        boundary.pop_back();
    }

    if (boundary.size() >= 2 && boundary.front() == '"' && boundary.back() == '"') {
        boundary = boundary.substr(1, boundary.length() - 2);
    }

    return boundary;
}

std::string MultipartParser::disposition_param(const std::string& disposition,
                                               const std::string& param) {
    // Match `param=` only at a parameter boundary so "name" never hits "filename"
    size_t pos = 0;
    while ((pos = disposition.find(param + "=", pos)) != std::string::npos) {
        bool at_boundary = pos == 0 || disposition[pos - 1] == ';' ||
                           std::isspace(static_cast<unsigned char>(disposition[pos - 1]));
        size_t value_start = pos + param.size() + 1;
        if (!at_boundary) {
            pos = value_start;
            continue;
        }

        if (value_start < disposition.size() && disposition[value_start] == '"') {
            size_t value_end = disposition.find('"', value_start + 1);
            if (value_end == std::string::npos) return "";
            return disposition.substr(value_start + 1, value_end - value_start - 1);
        }
        size_t value_end = disposition.find(';', value_start);
        if (value_end == std::string::npos) value_end = disposition.size();
        return disposition.substr(value_start, value_end - value_start);
    }
    return "";
}

MultipartPart MultipartParser::parse_part(const std::string& part_data) {
    MultipartPart part;

    size_t headers_end = part_data.find("\r\n\r\n");
    size_t content_start;
    if (headers_end != std::string::npos) {
        content_start = headers_end + 4;
    } else {
        headers_end = part_data.find("\n\n");
        if (headers_end == std::string::npos) return part;
        content_start = headers_end + 2;
    }

    std::istringstream headers_stream(part_data.substr(0, headers_end));
    std::string line;
    while (std::getline(headers_stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string key = line.substr(0, colon);
        size_t value_start = line.find_first_not_of(' ', colon + 1);
        std::string value = value_start == std::string::npos ? "" : line.substr(value_start);
        part.headers[key] = value;

        if (iequals(key, "Content-Disposition")) {
            part.name = disposition_param(value, "name");
            part.filename = disposition_param(value, "filename");
        }
    }

    part.data.assign(part_data.begin() + content_start, part_data.end());
    return part;
}

} // namespace scriptbox
