#ifndef REPORT_RENDERER_H
#define REPORT_RENDERER_H

#include <chrono>
#include <ostream>
#include <string>
#include <vector>
#include "model_description.h"
#include "table_formatter.h"

/**
 * @brief Renders a model description as titled, column-aligned sections
 *
 * Sections are written in a fixed order: Model, Parameters, Metadata,
 * Tensors, Projector, System, License, Capabilities. Each section is a
 * title line ("  Model"), its table and one blank line. Sections without
 * data are left out; Metadata and Tensors are only written in verbose mode.
 */
class ReportRenderer {
public:
    /// Number of System lines shown before the remainder is elided
    static const int SYSTEM_PREVIEW_LINES;

    /**
     * @brief Render all sections to a stream
     * @param description The model to describe
     * @param verbose Include the Metadata and Tensors sections
     * @param out Output stream
     * @param errorMessage Output: reason for failure
     * @return False only if writing to the stream failed
     */
    static bool render(const ModelDescription& description, bool verbose,
                       std::ostream& out, std::string& errorMessage);

    /**
     * @brief Render the model list as a NAME/ID/SIZE/MODIFIED table
     * @param models Models to list, in server order
     * @param prefix Only list models whose name starts with this prefix (empty: all)
     * @param now Reference time for the MODIFIED column
     * @param out Output stream
     * @param errorMessage Output: reason for failure
     * @return False only if writing to the stream failed
     */
    static bool renderModelList(const std::vector<ModelSummary>& models, const std::string& prefix,
                                std::chrono::system_clock::time_point now,
                                std::ostream& out, std::string& errorMessage);

    /**
     * @brief Build the always-present Model summary rows
     */
    static std::vector<TableRow> modelRows(const ModelDescription& description);

    /**
     * @brief Build the Projector summary rows (empty if there is no projector)
     */
    static std::vector<TableRow> projectorRows(const MetadataMap& projectorInfo);

    /**
     * @brief Split a parameter blob into key/value rows, keeping order and duplicates
     */
    static std::vector<TableRow> parameterRows(const std::string& parameters);

    /**
     * @brief Build key/value rows for every metadata entry, sorted by key
     */
    static std::vector<TableRow> metadataRows(const MetadataMap& metadata);

    /**
     * @brief Build name/type/shape rows for every tensor
     */
    static std::vector<TableRow> tensorRows(const std::vector<TensorInfo>& tensors);

    /**
     * @brief Build rows for free text, showing at most maxLines non-empty lines
     * @param text Multi-line text
     * @param maxLines Line limit; a "..." row follows when more lines exist
     */
    static std::vector<TableRow> previewRows(const std::string& text, int maxLines);

    /**
     * @brief Build one row per line of free text, trailing blank lines dropped
     */
    static std::vector<TableRow> textRows(const std::string& text);

    /**
     * @brief Build one row per capability tag
     */
    static std::vector<TableRow> capabilityRows(const std::vector<std::string>& capabilities);

    /**
     * @brief Format a tensor shape as "[d0 d1 ...]"
     */
    static std::string formatShape(const std::vector<std::uint64_t>& shape);

private:
    static bool writeSection(std::ostream& out, const std::string& title,
                             const std::vector<TableRow>& rows, std::string& errorMessage);

    /**
     * @brief Find the metadata key holding a summary value
     * @param metadata Map to search
     * @param preferredKey Exact key to use when present (e.g. "llama.context_length")
     * @param fragment Fallback: first key containing this fragment
     * @return Iterator to the entry, or metadata.end()
     */
    static MetadataMap::const_iterator findSummaryKey(const MetadataMap& metadata,
                                                      const std::string& preferredKey,
                                                      const std::string& fragment);

    static std::vector<std::string> splitLines(const std::string& text);
};

#endif // REPORT_RENDERER_H
