#include "type.hpp"

namespace jsonbcpp {

    std::optional<Type> type_from_raw(uint8_t raw) {
        switch (raw) {
            case 0x0: return Type::Null;
            case 0x1: return Type::True;
            case 0x2: return Type::False;
            case 0x3: return Type::Int;
            case 0x4: return Type::Int5;
            case 0x5: return Type::Float;
            case 0x6: return Type::Float5;
            case 0x7: return Type::Text;
            case 0x8: return Type::TextJ;
            case 0x9: return Type::Text5;
            case 0xA: return Type::TextRaw;
            case 0xB: return Type::Array;
            case 0xC: return Type::Object;
            case 0xD: return Type::Reserved13;
            case 0xE: return Type::Reserved14;
            case 0xF: return Type::Reserved15;
            default:
                return std::nullopt;
        }
    }

    std::string_view to_string(Type type) {
        switch (type) {
            case Type::Null: return "null";
            case Type::True: return "true";
            case Type::False: return "false";
            case Type::Int: return "int";
            case Type::Int5: return "int5";
            case Type::Float: return "float";
            case Type::Float5: return "float5";
            case Type::Text: return "text";
            case Type::TextJ: return "textj";
            case Type::Text5: return "text5";
            case Type::TextRaw: return "textraw";
            case Type::Array: return "array";
            case Type::Object: return "object";
            case Type::Reserved13: return "reserved13";
            case Type::Reserved14: return "reserved14";
            case Type::Reserved15: return "reserved15";
        }
        return "unknown";
    }

} // namespace jsonbcpp
