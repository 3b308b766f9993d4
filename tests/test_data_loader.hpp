#pragma once

#include "types/field_element.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace stark_sync {

/**
 * TestDataLoader - reads the JSON fixtures under tests/data
 */
class TestDataLoader {
public:
    explicit TestDataLoader(const std::string& test_data_dir);

    std::string file_path(const std::string& filename) const;
    nlohmann::json load_json(const std::string& filename) const;

    struct HashVector {
        FieldElement a;
        FieldElement b;
        FieldElement expected;
    };

    struct ArrayVector {
        std::vector<FieldElement> elements;
        FieldElement expected;
    };

    // pedersen_vectors.json
    std::vector<HashVector> load_hash_vectors() const;
    std::vector<ArrayVector> load_array_vectors() const;

private:
    std::string test_data_dir_;
};

} // namespace stark_sync
