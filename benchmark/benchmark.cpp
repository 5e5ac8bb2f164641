#include "document.hpp"
#include "json.hpp"
#include "text.hpp"
#include <iostream>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace {

// Smallest header for `size`, followed by nothing; payload is appended by the caller.
void append_header(std::vector<std::byte>& out, uint8_t type, uint64_t size) {
    if (size <= 11) {
        out.push_back(static_cast<std::byte>((size << 4) | type));
        return;
    }
    size_t size_bytes = size <= 0xFF ? 1 : size <= 0xFFFF ? 2 : size <= 0xFFFFFFFF ? 4 : 8;
    uint8_t size_class = size_bytes == 1 ? 12 : size_bytes == 2 ? 13 : size_bytes == 4 ? 14 : 15;
    out.push_back(static_cast<std::byte>((size_class << 4) | type));
    for (size_t i = size_bytes; i > 0; --i) {
        out.push_back(static_cast<std::byte>((size >> (8 * (i - 1))) & 0xFF));
    }
}

void append_text(std::vector<std::byte>& out, uint8_t type, const std::string& text) {
    append_header(out, type, text.size());
    for (char c : text) {
        out.push_back(static_cast<std::byte>(c));
    }
}

// {"key0":0, "key1":1, ...}
jsonbcpp::Document make_object(int members) {
    std::vector<std::byte> payload;
    for (int i = 0; i < members; ++i) {
        append_text(payload, 0x7, "key" + std::to_string(i));
        append_text(payload, 0x3, std::to_string(i));
    }
    std::vector<std::byte> blob;
    append_header(blob, 0xC, payload.size());
    blob.insert(blob.end(), payload.begin(), payload.end());
    return jsonbcpp::Document(std::move(blob));
}

// ["value0", "value1", ...]
jsonbcpp::Document make_array(int elements) {
    std::vector<std::byte> payload;
    for (int i = 0; i < elements; ++i) {
        append_text(payload, 0x7, "value" + std::to_string(i));
    }
    std::vector<std::byte> blob;
    append_header(blob, 0xB, payload.size());
    blob.insert(blob.end(), payload.begin(), payload.end());
    return jsonbcpp::Document(std::move(blob));
}

} // namespace

void benchmark_object_expansion() {
    jsonbcpp::Document doc = make_object(10000);
    auto start = std::chrono::high_resolution_clock::now();
    size_t found = 0;
    for (int i = 0; i < 10; ++i) {
        jsonbcpp::Object object = doc.root().object();
        found += object.size();
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_object_expansion: " << diff.count() << " s (" << found << " members)" << std::endl;
}

void benchmark_array_expansion() {
    jsonbcpp::Document doc = make_array(10000);
    auto start = std::chrono::high_resolution_clock::now();
    size_t found = 0;
    for (int i = 0; i < 10; ++i) {
        found += doc.root().array().size();
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_array_expansion: " << diff.count() << " s (" << found << " elements)" << std::endl;
}

void benchmark_lazy_elements() {
    jsonbcpp::Document doc = make_array(10000);
    auto start = std::chrono::high_resolution_clock::now();
    size_t bytes = 0;
    for (int i = 0; i < 10; ++i) {
        for (const jsonbcpp::Value& value : doc.root().elements()) {
            bytes += jsonbcpp::decode_string(value).size();
        }
    }
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_lazy_elements: " << diff.count() << " s (" << bytes << " text bytes)" << std::endl;
}

void benchmark_json_rendering() {
    jsonbcpp::Document doc = make_object(10000);
    auto start = std::chrono::high_resolution_clock::now();
    std::string json_str = jsonbcpp::jsonb_json::to_json_string(doc.root());
    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> diff = end - start;
    std::cout << "benchmark_json_rendering: " << diff.count() << " s (" << json_str.size() << " chars)" << std::endl;
}

int main() {
    try {
        benchmark_object_expansion();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_object_expansion failed: " << e.what() << std::endl;
    }
    try {
        benchmark_array_expansion();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_array_expansion failed: " << e.what() << std::endl;
    }
    try {
        benchmark_lazy_elements();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_lazy_elements failed: " << e.what() << std::endl;
    }
    try {
        benchmark_json_rendering();
    } catch (const std::exception& e) {
        std::cerr << "benchmark_json_rendering failed: " << e.what() << std::endl;
    }
    return 0;
}
