#include "star_miner/io/pattern_library.hpp"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace star_miner {
namespace io {

namespace {

using rapidjson::Document;
using rapidjson::Value;

Value make_int_array(const std::vector<int64_t>& values, Document::AllocatorType& allocator) {
    Value array(rapidjson::kArrayType);
    for (int64_t v : values) {
        array.PushBack(v, allocator);
    }
    return array;
}

Value make_data_value(const DataValue& value, Document::AllocatorType& allocator) {
    if (auto* i = std::get_if<int64_t>(&value)) {
        return Value(*i);
    }
    if (auto* s = std::get_if<std::string>(&value)) {
        return Value(s->c_str(), static_cast<rapidjson::SizeType>(s->size()), allocator);
    }
    return make_int_array(std::get<std::vector<int64_t>>(value), allocator);
}

Value make_pattern(const Pattern& pattern, Document::AllocatorType& allocator) {
    Value obj(rapidjson::kObjectType);
    obj.AddMember("id", Value(pattern.id.c_str(), allocator), allocator);
    obj.AddMember("window_width", static_cast<uint64_t>(pattern.window_width), allocator);
    obj.AddMember("window_height", static_cast<uint64_t>(pattern.window_height), allocator);

    Value data(rapidjson::kObjectType);
    for (const auto& [key, value] : pattern.data.entries()) {
        data.AddMember(Value(key.c_str(), allocator), make_data_value(value, allocator), allocator);
    }
    obj.AddMember("data", data, allocator);

    Value deductions(rapidjson::kArrayType);
    for (const auto& deduction : pattern.deductions) {
        Value d(rapidjson::kObjectType);
        d.AddMember("type", Value(deduction_kind_name(deduction.kind), allocator), allocator);
        d.AddMember("relative_cell_ids", make_int_array(deduction.relative_cell_ids, allocator), allocator);
        deductions.PushBack(d, allocator);
    }
    obj.AddMember("deductions", deductions, allocator);
    return obj;
}

// ===== 読み込み =====

const Value& require_member(const Value& obj, const char* name, const std::string& where) {
    if (!obj.IsObject()) {
        throw std::runtime_error(where + " is not an object");
    }
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd()) {
        throw std::runtime_error(where + ": missing field '" + name + "'");
    }
    return it->value;
}

int64_t require_int(const Value& obj, const char* name, const std::string& where) {
    const Value& v = require_member(obj, name, where);
    if (!v.IsInt64()) {
        throw std::runtime_error(where + ": field '" + std::string(name) + "' must be an integer");
    }
    return v.GetInt64();
}

size_t require_size(const Value& obj, const char* name, const std::string& where) {
    int64_t v = require_int(obj, name, where);
    if (v < 0) {
        throw std::runtime_error(where + ": field '" + std::string(name) + "' must not be negative");
    }
    return static_cast<size_t>(v);
}

std::string require_string(const Value& obj, const char* name, const std::string& where) {
    const Value& v = require_member(obj, name, where);
    if (!v.IsString()) {
        throw std::runtime_error(where + ": field '" + std::string(name) + "' must be a string");
    }
    return std::string(v.GetString(), v.GetStringLength());
}

std::vector<int64_t> read_int_array(const Value& v, const std::string& where) {
    if (!v.IsArray()) {
        throw std::runtime_error(where + " must be an array of integers");
    }
    std::vector<int64_t> values;
    values.reserve(v.Size());
    for (const auto& item : v.GetArray()) {
        if (!item.IsInt64()) {
            throw std::runtime_error(where + " must be an array of integers");
        }
        values.push_back(item.GetInt64());
    }
    return values;
}

PatternData read_data(const Value& v, const std::string& where) {
    if (!v.IsObject()) {
        throw std::runtime_error(where + ": 'data' must be an object");
    }
    PatternData data;
    for (const auto& member : v.GetObject()) {
        std::string key(member.name.GetString(), member.name.GetStringLength());
        const Value& value = member.value;
        if (value.IsInt64()) {
            data.set(key, value.GetInt64());
        } else if (value.IsString()) {
            data.set(key, std::string(value.GetString(), value.GetStringLength()));
        } else {
            data.set(key, read_int_array(value, where + ".data." + key));
        }
    }
    return data;
}

Pattern read_pattern(const Value& v, const std::string& family_id, size_t index) {
    std::string where = "patterns[" + std::to_string(index) + "]";
    Pattern pattern;
    pattern.family_id = family_id;
    pattern.id = require_string(v, "id", where);
    pattern.window_width = require_size(v, "window_width", where);
    pattern.window_height = require_size(v, "window_height", where);
    pattern.data = read_data(require_member(v, "data", where), where);

    const Value& deductions = require_member(v, "deductions", where);
    if (!deductions.IsArray()) {
        throw std::runtime_error(where + ": 'deductions' must be an array");
    }
    for (const auto& d : deductions.GetArray()) {
        std::string type = require_string(d, "type", where + ".deductions");
        auto kind = parse_deduction_kind(type);
        if (!kind) {
            throw std::runtime_error(where + ": unknown deduction type '" + type + "'");
        }
        pattern.deductions.push_back(Deduction{
            *kind,
            read_int_array(require_member(d, "relative_cell_ids", where + ".deductions"),
                           where + ".deductions.relative_cell_ids")});
    }
    return pattern;
}

} // anonymous namespace

std::string library_file_name(size_t board_size, const std::string& family_id) {
    std::ostringstream oss;
    oss << board_size << "x" << board_size << "-" << family_id << "-patterns.json";
    return oss.str();
}

std::string pattern_library_to_json(const PatternLibrary& library) {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("board_size", static_cast<uint64_t>(library.board_size), allocator);
    doc.AddMember("stars_per_row", library.stars_per_row, allocator);
    doc.AddMember("stars_per_column", library.stars_per_column, allocator);
    doc.AddMember("family_id", Value(library.family.family_id.c_str(), allocator), allocator);

    Value patterns(rapidjson::kArrayType);
    for (const auto& pattern : library.family.patterns) {
        patterns.PushBack(make_pattern(pattern, allocator), allocator);
    }
    doc.AddMember("patterns", patterns, allocator);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

PatternLibrary pattern_library_from_json(const std::string& json) {
    Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        throw std::runtime_error(std::string("JSON parse error at offset ") +
                                 std::to_string(doc.GetErrorOffset()) + ": " +
                                 rapidjson::GetParseError_En(doc.GetParseError()));
    }

    const std::string where = "pattern library";
    PatternLibrary library;
    library.board_size = require_size(doc, "board_size", where);
    library.stars_per_row = static_cast<int>(require_int(doc, "stars_per_row", where));
    library.stars_per_column = static_cast<int>(require_int(doc, "stars_per_column", where));
    library.family.family_id = require_string(doc, "family_id", where);

    const Value& patterns = require_member(doc, "patterns", where);
    if (!patterns.IsArray()) {
        throw std::runtime_error(where + ": 'patterns' must be an array");
    }
    size_t index = 0;
    for (const auto& p : patterns.GetArray()) {
        library.family.patterns.push_back(read_pattern(p, library.family.family_id, index++));
    }
    return library;
}

std::string write_pattern_library(const FamilyPatternSet& family,
                                  size_t board_size,
                                  int stars_per_row,
                                  int stars_per_column,
                                  const std::string& output_dir) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + output_dir + ": " + ec.message());
    }

    PatternLibrary library;
    library.board_size = board_size;
    library.stars_per_row = stars_per_row;
    library.stars_per_column = stars_per_column;
    library.family = family;

    fs::path path = fs::path(output_dir) / library_file_name(board_size, family.family_id);
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path.string());
    }
    out << pattern_library_to_json(library) << "\n";
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + path.string());
    }
    return path.string();
}

std::vector<std::string> write_all_pattern_libraries(const std::vector<FamilyPatternSet>& families,
                                                     size_t board_size,
                                                     int stars_per_unit,
                                                     const std::string& output_dir) {
    std::vector<std::string> paths;
    paths.reserve(families.size());
    for (const auto& family : families) {
        paths.push_back(write_pattern_library(family, board_size, stars_per_unit,
                                              stars_per_unit, output_dir));
    }
    return paths;
}

PatternLibrary read_pattern_library(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return pattern_library_from_json(ss.str());
}

} // namespace io
} // namespace star_miner
