#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>

namespace scriptbox {

// One part of a multipart/form-data body
struct MultipartPart {
    std::map<std::string, std::string> headers;
    std::string name;
    std::string filename;
    std::vector<uint8_t> data;
};

class MultipartParser {
public:
    // Parts in body order; empty if the content type carries no boundary
    static std::vector<MultipartPart> parse(
        const std::string& content_type,
        const std::string& body
    );

    // First part with the given form field name, or nullptr
    static const MultipartPart* find(const std::vector<MultipartPart>& parts,
                                     const std::string& name);

    static std::string extract_boundary(const std::string& content_type);

private:
    static MultipartPart parse_part(const std::string& part_data);
    static std::string disposition_param(const std::string& disposition, const std::string& param);
};

} // namespace scriptbox
