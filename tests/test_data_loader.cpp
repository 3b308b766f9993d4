#include "test_data_loader.hpp"
#include <fstream>
#include <stdexcept>

namespace stark_sync {

TestDataLoader::TestDataLoader(const std::string& test_data_dir)
    : test_data_dir_(test_data_dir) {}

std::string TestDataLoader::file_path(const std::string& filename) const {
    return test_data_dir_ + "/" + filename;
}

nlohmann::json TestDataLoader::load_json(const std::string& filename) const {
    std::ifstream file(file_path(filename));
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path(filename));
    }
    return nlohmann::json::parse(file);
}

std::vector<TestDataLoader::HashVector> TestDataLoader::load_hash_vectors() const {
    auto json = load_json("pedersen_vectors.json");

    std::vector<HashVector> vectors;
    for (const auto& entry : json["hash"]) {
        HashVector v;
        v.a = FieldElement::from_hex(entry["a"].get<std::string>());
        v.b = FieldElement::from_hex(entry["b"].get<std::string>());
        v.expected = FieldElement::from_hex(entry["expected"].get<std::string>());
        vectors.push_back(v);
    }
    return vectors;
}

std::vector<TestDataLoader::ArrayVector> TestDataLoader::load_array_vectors() const {
    auto json = load_json("pedersen_vectors.json");

    std::vector<ArrayVector> vectors;
    for (const auto& entry : json["array"]) {
        ArrayVector v;
        for (const auto& element : entry["elements"]) {
            v.elements.push_back(FieldElement::from_hex(element.get<std::string>()));
        }
        v.expected = FieldElement::from_hex(entry["expected"].get<std::string>());
        vectors.push_back(v);
    }
    return vectors;
}

} // namespace stark_sync
