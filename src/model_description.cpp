#include "model_description.h"
#include "number_format.h"

MetadataValue::MetadataValue() : m_value(std::string()) {}

MetadataValue::MetadataValue(const std::string& value) : m_value(value) {}

MetadataValue::MetadataValue(const char* value) : m_value(std::string(value)) {}

MetadataValue::MetadataValue(double value) : m_value(value) {}

MetadataValue::MetadataValue(bool value) : m_value(value) {}

MetadataValue::Kind MetadataValue::kind() const {
    switch (m_value.index()) {
        case 1:
            return Kind::Number;
        case 2:
            return Kind::Bool;
        default:
            return Kind::String;
    }
}

const std::string& MetadataValue::asString() const {
    static const std::string empty;
    if (const std::string* value = std::get_if<std::string>(&m_value)) {
        return *value;
    }
    return empty;
}

double MetadataValue::asNumber() const {
    if (const double* value = std::get_if<double>(&m_value)) {
        return *value;
    }
    return 0.0;
}

bool MetadataValue::asBool() const {
    if (const bool* value = std::get_if<bool>(&m_value)) {
        return *value;
    }
    return false;
}

std::string MetadataValue::toString() const {
    switch (kind()) {
        case Kind::Number:
            return NumberFormat::formatGeneral(asNumber());
        case Kind::Bool:
            return asBool() ? "true" : "false";
        case Kind::String:
            break;
    }
    return asString();
}

std::string MetadataValue::toDecimalString() const {
    if (isNumber()) {
        return NumberFormat::formatDecimal(asNumber());
    }
    return toString();
}

std::string ModelSummary::shortId() const {
    return digest.substr(0, 12);
}
