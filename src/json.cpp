#include "json.hpp"
#include "config.hpp"
#include "exception.hpp"
#include "iterator.hpp"
#include "number.hpp"
#include "object.hpp"
#include "observability.hpp"
#include "text.hpp"
#include <yyjson.h>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <string_view>

namespace jsonbcpp {
    namespace jsonb_json {

        namespace {

            using doc_ptr = std::unique_ptr<yyjson_mut_doc, decltype(&yyjson_mut_doc_free)>;

            yyjson_mut_val* checked(yyjson_mut_val* val) {
                if (!val) {
                    throw jsonbcpp::exception("yyjson allocation failed");
                }
                return val;
            }

            yyjson_mut_val* raw_number(yyjson_mut_doc* doc, std::string_view text) {
                return checked(yyjson_mut_rawncpy(doc, text.data(), text.size()));
            }

            yyjson_mut_val* to_yyjson_val(const Value& value, yyjson_mut_doc* doc, size_t depth) {
                if (depth > config::max_depth) {
                    throw_decode_error(ErrorKind::NestingTooDeep,
                                       "nesting exceeds " + std::to_string(config::max_depth) + " levels", "ToJson",
                                       value.start_index());
                }

                switch (value.type()) {
                    case Type::Null:
                        return checked(yyjson_mut_null(doc));
                    case Type::True:
                        return checked(yyjson_mut_true(doc));
                    case Type::False:
                        return checked(yyjson_mut_false(doc));
                    case Type::Int: {
                        std::string_view text = value.payload().as_string_view();
                        if (!is_canonical_number(text, true)) {
                            throw_decode_error(ErrorKind::InvalidNumber,
                                               "malformed int payload \"" + std::string(text) + "\"", "ToJson",
                                               value.start_index());
                        }
                        return raw_number(doc, text);
                    }
                    case Type::Int5:
                        return checked(yyjson_mut_sint(doc, to_int64(value)));
                    case Type::Float:
                        // validates; canonical text is written back verbatim
                        (void)to_double(value);
                        return raw_number(doc, value.payload().as_string_view());
                    case Type::Float5: {
                        double d = to_double(value);
                        if (std::isnan(d)) {
                            return checked(yyjson_mut_null(doc));
                        }
                        if (std::isinf(d)) {
                            return raw_number(doc, d < 0 ? "-9e999" : "9e999");
                        }
                        return checked(yyjson_mut_real(doc, d));
                    }
                    case Type::Text:
                    case Type::TextJ:
                    case Type::Text5:
                    case Type::TextRaw: {
                        std::string text = decode_string(value);
                        return checked(yyjson_mut_strncpy(doc, text.data(), text.size()));
                    }
                    case Type::Array: {
                        yyjson_mut_val* arr = checked(yyjson_mut_arr(doc));
                        for (const Value& element : value.elements()) {
                            if (!yyjson_mut_arr_append(arr, to_yyjson_val(element, doc, depth + 1))) {
                                throw jsonbcpp::exception("yyjson_mut_arr_append failed");
                            }
                        }
                        return arr;
                    }
                    case Type::Object: {
                        yyjson_mut_val* obj = checked(yyjson_mut_obj(doc));
                        for (const auto& [key, member] : value.object()) {
                            yyjson_mut_val* k = checked(yyjson_mut_strncpy(doc, key.data(), key.size()));
                            if (!yyjson_mut_obj_add(obj, k, to_yyjson_val(member, doc, depth + 1))) {
                                throw jsonbcpp::exception("yyjson_mut_obj_add failed");
                            }
                        }
                        return obj;
                    }
                    case Type::Reserved13:
                    case Type::Reserved14:
                    case Type::Reserved15:
                        break;
                }
                throw_decode_error(ErrorKind::UnhandledType,
                                   "cannot render " + std::string(to_string(value.type())) + " as JSON", "ToJson",
                                   value.start_index(), static_cast<uint8_t>(value.type()));
            }

        } // namespace

        std::string to_json_string(const Value& value, bool pretty) {
            auto start = std::chrono::steady_clock::now();
            std::string_view status = "error";
            auto finish = [&]() {
                auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
                log_if_enabled(LogLevel::Debug, "to_json_string finished.", "ToJson", elapsed, value.start_index());
                metrics_if_enabled([&](IMetrics& m) {
                    m.record_latency("ToJson", std::chrono::duration<double>(elapsed).count());
                    m.increment_operation_count("ToJson", status);
                });
            };

            doc_ptr doc(yyjson_mut_doc_new(nullptr), &yyjson_mut_doc_free);
            if (!doc) {
                throw jsonbcpp::exception("yyjson_mut_doc_new failed");
            }

            try {
                yyjson_mut_doc_set_root(doc.get(), to_yyjson_val(value, doc.get(), 0));
            } catch (const jsonbcpp::exception&) {
                finish();
                throw;
            }

            yyjson_write_flag flags = pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG;
            size_t len = 0;
            char* json_str = yyjson_mut_write(doc.get(), flags, &len);
            if (!json_str) {
                finish();
                throw jsonbcpp::exception("yyjson_mut_write failed");
            }
            std::string result(json_str, len);
            free(json_str);

            status = "ok";
            finish();
            return result;
        }

    } // namespace jsonb_json
} // namespace jsonbcpp
