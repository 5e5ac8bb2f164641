#include "observability.hpp"
#include "document.hpp"
#include "json.hpp"
#include <iostream>

class ConsoleLogger : public jsonbcpp::ILogger {
public:
    bool log(jsonbcpp::LogLevel level,
           std::string_view message,
           std::string_view operation,
           std::chrono::microseconds duration,
           size_t buffer_offset,
           std::string_view key) override {
        std::cout << "[LogLevel::" << static_cast<int>(level) << "] "
                  << message << " | "
                  << "operation: " << operation << " | "
                  << "duration: " << duration.count() << "us | "
                  << "offset: " << buffer_offset << " | "
                  << "key: " << key
                  << std::endl;
        return true;
    }
};


class ConsoleMetrics : public jsonbcpp::IMetrics {
public:
    bool record_latency(std::string_view operation, double seconds) override {
        std::cout << "Metric: " << operation << " latency: " << seconds << "s" << std::endl;
        return true;
    }
    bool increment_operation_count(std::string_view operation, std::string_view status) override {
        std::cout << "Metric: " << operation << " count: 1, status: " << status << std::endl;
        return true;
    }
    bool record_bytes_decoded(size_t bytes) override {
        std::cout << "Metric: bytes decoded: " << bytes << std::endl;
        return true;
    }
    bool record_error(jsonbcpp::ErrorKind kind) override {
        std::cout << "Metric: error: " << jsonbcpp::to_string(kind) << std::endl;
        return true;
    }
};

static void render(const char* label, std::string_view hex) {
    std::cout << "\n--- " << label << " (" << hex << ") ---" << std::endl;
    try {
        jsonbcpp::Document doc = jsonbcpp::Document::from_hex(hex);
        std::cout << jsonbcpp::jsonb_json::to_json_string(doc.root()) << std::endl;
    } catch (const jsonbcpp::decode_error& e) {
        std::cout << "decode_error (" << jsonbcpp::to_string(e.kind()) << "): " << e.what() << std::endl;
    }
}

int main(int argc, char** argv) {
    ConsoleLogger logger;
    ConsoleMetrics metrics;
    jsonbcpp::set_logger(&logger);
    jsonbcpp::set_metrics(&metrics);

    if (argc > 1) {
        jsonbcpp::set_log_level_threshold(jsonbcpp::LogLevel::Debug);
        for (int i = 1; i < argc; ++i) {
            render("argument", argv[i]);
        }
        return 0;
    }

    // Default threshold is Info: only the Warn from the malformed blob is logged.
    render("object", "6c 17 61 3b 13 31 00");
    render("truncated array", "3b 00 27 61");

    std::cout << "\n--- Setting log level to Debug ---" << std::endl;
    jsonbcpp::set_log_level_threshold(jsonbcpp::LogLevel::Debug);
    render("json5 values", "cb 0e 44 30 78 31 46 86 49 6e 66 69 6e 69 74 79");
    render("reserved type", "0d");

    return 0;
}
