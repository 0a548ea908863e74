#include "report_renderer.h"
#include "number_format.h"
#include <cmath>
#include <sstream>

const int ReportRenderer::SYSTEM_PREVIEW_LINES = 2;

namespace {

const char* WHITESPACE = " \t\r\n\f\v";

std::string trimRight(const std::string& text) {
    size_t end = text.find_last_not_of(WHITESPACE);
    if (end == std::string::npos) {
        return "";
    }
    return text.substr(0, end + 1);
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(WHITESPACE);
    return text.substr(start, end - start + 1);
}

std::string architectureOf(const MetadataMap& metadata) {
    auto it = metadata.find("general.architecture");
    if (it == metadata.end()) {
        return "";
    }
    return it->second.toString();
}

std::string scaledParameterCount(const MetadataValue& value) {
    if (value.isNumber() && value.asNumber() >= 0 && std::isfinite(value.asNumber())) {
        return NumberFormat::formatParameterCount(static_cast<std::uint64_t>(value.asNumber()));
    }
    return value.toString();
}

} // namespace

bool ReportRenderer::render(const ModelDescription& description, bool verbose,
                            std::ostream& out, std::string& errorMessage) {
    if (!writeSection(out, "Model", modelRows(description), errorMessage)) {
        return false;
    }

    std::vector<TableRow> parameters = parameterRows(description.parameters);
    if (!parameters.empty() && !writeSection(out, "Parameters", parameters, errorMessage)) {
        return false;
    }

    if (verbose && !description.modelInfo.empty()) {
        if (!writeSection(out, "Metadata", metadataRows(description.modelInfo), errorMessage)) {
            return false;
        }
    }

    if (verbose && !description.tensors.empty()) {
        if (!writeSection(out, "Tensors", tensorRows(description.tensors), errorMessage)) {
            return false;
        }
    }

    std::vector<TableRow> projector = projectorRows(description.projectorInfo);
    if (!projector.empty() && !writeSection(out, "Projector", projector, errorMessage)) {
        return false;
    }

    std::vector<TableRow> system = previewRows(description.system, SYSTEM_PREVIEW_LINES);
    if (!system.empty() && !writeSection(out, "System", system, errorMessage)) {
        return false;
    }

    std::vector<TableRow> license = textRows(description.license);
    if (!license.empty() && !writeSection(out, "License", license, errorMessage)) {
        return false;
    }

    if (!description.capabilities.empty()) {
        if (!writeSection(out, "Capabilities", capabilityRows(description.capabilities), errorMessage)) {
            return false;
        }
    }

    out.flush();
    if (!out) {
        errorMessage = "failed to flush model report";
        return false;
    }
    return true;
}

bool ReportRenderer::renderModelList(const std::vector<ModelSummary>& models, const std::string& prefix,
                                     std::chrono::system_clock::time_point now,
                                     std::ostream& out, std::string& errorMessage) {
    // Header and rows share one padding, so the last header cell is padded to
    // the widest MODIFIED value; earlier list output padded it one short ("MODIFIED     ")
    std::vector<TableRow> rows;
    rows.push_back({"NAME", "ID", "SIZE", "MODIFIED"});

    for (const auto& model : models) {
        if (model.name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }

        std::string modified = "Never";
        std::chrono::system_clock::time_point modifiedAt;
        if (NumberFormat::parseTimestamp(model.modifiedAt, modifiedAt)) {
            modified = NumberFormat::formatRelativeTime(modifiedAt, now);
        }

        rows.push_back({model.name, model.shortId(), NumberFormat::formatBytes(model.size), modified});
    }

    out << TableFormatter::format(rows, 0);
    out.flush();
    if (!out) {
        errorMessage = "failed to write model list";
        return false;
    }
    return true;
}

std::vector<TableRow> ReportRenderer::modelRows(const ModelDescription& description) {
    const MetadataMap& info = description.modelInfo;
    std::vector<TableRow> rows;

    std::string architecture = architectureOf(info);
    rows.push_back({"architecture", architecture.empty() ? description.details.family : architecture});

    std::string parameters = description.details.parameterSize;
    if (parameters.empty()) {
        auto count = info.find("general.parameter_count");
        if (count != info.end()) {
            parameters = scaledParameterCount(count->second);
        }
    }
    rows.push_back({"parameters", parameters});

    auto contextLength = findSummaryKey(info, architecture + ".context_length", "context_length");
    if (contextLength != info.end()) {
        rows.push_back({"context length", contextLength->second.toDecimalString()});
    }

    auto embeddingLength = findSummaryKey(info, architecture + ".embedding_length", "embedding_length");
    if (embeddingLength != info.end()) {
        rows.push_back({"embedding length", embeddingLength->second.toDecimalString()});
    }

    rows.push_back({"quantization", description.details.quantizationLevel});
    return rows;
}

std::vector<TableRow> ReportRenderer::projectorRows(const MetadataMap& projectorInfo) {
    std::vector<TableRow> rows;
    if (projectorInfo.empty()) {
        return rows;
    }

    std::string architecture = architectureOf(projectorInfo);
    if (!architecture.empty()) {
        rows.push_back({"architecture", architecture});
    }

    auto count = projectorInfo.find("general.parameter_count");
    if (count != projectorInfo.end()) {
        rows.push_back({"parameters", scaledParameterCount(count->second)});
    }

    const std::string prefix = architecture + ".vision.";
    auto contextLength = findSummaryKey(projectorInfo, prefix + "context_length", "context_length");
    if (contextLength != projectorInfo.end()) {
        rows.push_back({"context length", contextLength->second.toDecimalString()});
    }

    auto embeddingLength = findSummaryKey(projectorInfo, prefix + "embedding_length", "embedding_length");
    if (embeddingLength != projectorInfo.end()) {
        rows.push_back({"embedding length", embeddingLength->second.toDecimalString()});
    }

    auto dimensions = findSummaryKey(projectorInfo, prefix + "projection_dim", "projection_dim");
    if (dimensions != projectorInfo.end()) {
        rows.push_back({"dimensions", dimensions->second.toDecimalString()});
    }

    return rows;
}

std::vector<TableRow> ReportRenderer::parameterRows(const std::string& parameters) {
    std::vector<TableRow> rows;
    for (const auto& rawLine : splitLines(parameters)) {
        std::string line = trim(rawLine);
        if (line.empty()) {
            continue;
        }

        size_t keyEnd = line.find_first_of(WHITESPACE);
        if (keyEnd == std::string::npos) {
            rows.push_back({line});
            continue;
        }
        rows.push_back({line.substr(0, keyEnd), trim(line.substr(keyEnd))});
    }
    return rows;
}

std::vector<TableRow> ReportRenderer::metadataRows(const MetadataMap& metadata) {
    std::vector<TableRow> rows;
    rows.reserve(metadata.size());
    // std::map iterates in key order
    for (const auto& entry : metadata) {
        rows.push_back({entry.first, entry.second.toString()});
    }
    return rows;
}

std::vector<TableRow> ReportRenderer::tensorRows(const std::vector<TensorInfo>& tensors) {
    std::vector<TableRow> rows;
    rows.reserve(tensors.size());
    for (const auto& tensor : tensors) {
        rows.push_back({tensor.name, tensor.type, formatShape(tensor.shape)});
    }
    return rows;
}

std::vector<TableRow> ReportRenderer::previewRows(const std::string& text, int maxLines) {
    std::vector<TableRow> rows;
    int count = 0;
    for (const auto& rawLine : splitLines(text)) {
        std::string line = trimRight(rawLine);
        if (line.empty()) {
            continue;
        }
        count++;
        if (count <= maxLines) {
            rows.push_back({line});
        }
    }
    if (count > maxLines) {
        rows.push_back({"..."});
    }
    return rows;
}

std::vector<TableRow> ReportRenderer::textRows(const std::string& text) {
    std::vector<TableRow> rows;
    for (const auto& rawLine : splitLines(text)) {
        rows.push_back({trimRight(rawLine)});
    }
    while (!rows.empty() && rows.back().front().empty()) {
        rows.pop_back();
    }
    return rows;
}

std::vector<TableRow> ReportRenderer::capabilityRows(const std::vector<std::string>& capabilities) {
    std::vector<TableRow> rows;
    rows.reserve(capabilities.size());
    for (const auto& capability : capabilities) {
        rows.push_back({capability});
    }
    return rows;
}

std::string ReportRenderer::formatShape(const std::vector<std::uint64_t>& shape) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) {
            oss << " ";
        }
        oss << shape[i];
    }
    oss << "]";
    return oss.str();
}

bool ReportRenderer::writeSection(std::ostream& out, const std::string& title,
                                  const std::vector<TableRow>& rows, std::string& errorMessage) {
    out << "  " << title << "\n" << TableFormatter::format(rows) << "\n";
    if (!out) {
        errorMessage = "failed to write " + title + " section";
        return false;
    }
    return true;
}

MetadataMap::const_iterator ReportRenderer::findSummaryKey(const MetadataMap& metadata,
                                                           const std::string& preferredKey,
                                                           const std::string& fragment) {
    auto it = metadata.find(preferredKey);
    if (it != metadata.end()) {
        return it;
    }
    for (it = metadata.begin(); it != metadata.end(); ++it) {
        if (it->first.find(fragment) != std::string::npos) {
            return it;
        }
    }
    return metadata.end();
}

std::vector<std::string> ReportRenderer::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}
