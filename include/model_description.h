#ifndef MODEL_DESCRIPTION_H
#define MODEL_DESCRIPTION_H

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

/**
 * @brief A single metadata value: a string, a number or a boolean
 */
class MetadataValue {
public:
    enum class Kind {
        String,
        Number,
        Bool
    };

    MetadataValue();
    MetadataValue(const std::string& value);
    MetadataValue(const char* value);
    MetadataValue(double value);
    MetadataValue(bool value);

    Kind kind() const;
    bool isString() const { return kind() == Kind::String; }
    bool isNumber() const { return kind() == Kind::Number; }
    bool isBool() const { return kind() == Kind::Bool; }

    /**
     * @brief Get the string payload (empty unless kind() is String)
     */
    const std::string& asString() const;

    /**
     * @brief Get the numeric payload (0 unless kind() is Number)
     */
    double asNumber() const;

    /**
     * @brief Get the boolean payload (false unless kind() is Bool)
     */
    bool asBool() const;

    /**
     * @brief Render the value for the metadata table
     * @return Strings verbatim, booleans as "true"/"false", numbers in
     *         shortest general form (e.g. "8e+09", "1000")
     */
    std::string toString() const;

    /**
     * @brief Render the value for a summary row
     * @return Like toString(), except numbers never use an exponent
     */
    std::string toDecimalString() const;

    bool operator==(const MetadataValue& other) const { return m_value == other.m_value; }
    bool operator!=(const MetadataValue& other) const { return !(*this == other); }

private:
    std::variant<std::string, double, bool> m_value;
};

/**
 * @brief Metadata keyed by dotted name (e.g. "llama.context_length"), sorted by key
 */
using MetadataMap = std::map<std::string, MetadataValue>;

/**
 * @brief Summary details reported for a model
 */
struct ModelDetails {
    std::string family;             ///< Model family (e.g. "llama")
    std::string parameterSize;      ///< Parameter size as reported (e.g. "7B")
    std::string quantizationLevel;  ///< Quantization level (e.g. "Q4_K_M")
    std::string format;             ///< File format (e.g. "gguf")
    std::string parentModel;        ///< Model this one was derived from, if any
};

/**
 * @brief A tensor entry of the model file
 */
struct TensorInfo {
    std::string name;                   ///< Tensor name (e.g. "blk.0.attn_k.weight")
    std::string type;                   ///< Element type (e.g. "BF16")
    std::vector<std::uint64_t> shape;   ///< Dimensions in file order
};

/**
 * @brief A seeded conversation turn stored with a model
 */
struct ChatMessage {
    std::string role;       ///< "system", "user" or "assistant"
    std::string content;

    bool operator==(const ChatMessage& other) const {
        return role == other.role && content == other.content;
    }
};

/**
 * @brief Everything the report renderer knows about a model
 */
struct ModelDescription {
    ModelDetails details;
    MetadataMap modelInfo;
    MetadataMap projectorInfo;
    std::string parameters;                 ///< One "key value" pair per line
    std::vector<TensorInfo> tensors;
    std::string system;
    std::string license;
    std::vector<std::string> capabilities;  ///< Lower-case capability tags (e.g. "vision")
    std::string modifiedAt;                 ///< Server timestamp, RFC 3339
    std::vector<ChatMessage> messages;      ///< Seeded conversation, not rendered
};

/**
 * @brief Structure to represent a locally available model
 */
struct ModelSummary {
    std::string name;           // Model name with tag (e.g., "llama3:8b")
    std::string digest;         // Model digest (e.g., "sha256:abc123...")
    long long size = 0;         // Model size in bytes
    std::string modifiedAt;     // Last modified timestamp, RFC 3339

    /**
     * @brief Short identifier shown in listings (first 12 characters of the digest)
     */
    std::string shortId() const;
};

#endif // MODEL_DESCRIPTION_H
