#include "streamcsv/row.h"

#include <stdexcept>

namespace streamcsv {

const std::string& Row::at(size_t index) const {
    if (index >= values_.size()) {
        throw std::out_of_range("Field index out of range: " + std::to_string(index));
    }
    return values_[index];
}

const std::string* Row::find(const std::string& name) const {
    for (const Field& field : fields_) {
        if (field.name == name) {
            return &field.value;
        }
    }
    return nullptr;
}

const std::string& Row::operator[](const std::string& name) const {
    const std::string* value = find(name);
    if (!value) {
        throw std::out_of_range("Column not found: " + name);
    }
    return *value;
}

} // namespace streamcsv
