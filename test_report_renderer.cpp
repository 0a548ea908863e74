#include <gtest/gtest.h>
#include <chrono>
#include <sstream>
#include "number_format.h"
#include "report_renderer.h"

namespace {

ModelDescription baseDescription(const std::string& parameterSize) {
    ModelDescription description;
    description.details.family = "test";
    description.details.parameterSize = parameterSize;
    description.details.quantizationLevel = "FP16";
    return description;
}

std::string render(const ModelDescription& description, bool verbose) {
    std::ostringstream out;
    std::string errorMessage;
    EXPECT_TRUE(ReportRenderer::render(description, verbose, out, errorMessage)) << errorMessage;
    return out.str();
}

const char* BARE_MODEL_SECTION =
    "  Model\n"
    "    architecture    test    \n"
    "    parameters      7B      \n"
    "    quantization    FP16    \n"
    "\n";

} // namespace

TEST(ReportRendererTest, BareDetails) {
    EXPECT_EQ(render(baseDescription("7B"), false), BARE_MODEL_SECTION);
}

TEST(ReportRendererTest, BareModelInfo) {
    ModelDescription description = baseDescription("7B");
    description.modelInfo["general.architecture"] = MetadataValue("test");
    description.modelInfo["general.parameter_count"] = MetadataValue(7000000000.0);
    description.modelInfo["test.context_length"] = MetadataValue(0.0);
    description.modelInfo["test.embedding_length"] = MetadataValue(0.0);

    const std::string expected =
        "  Model\n"
        "    architecture        test    \n"
        "    parameters          7B      \n"
        "    context length      0       \n"
        "    embedding length    0       \n"
        "    quantization        FP16    \n"
        "\n";
    EXPECT_EQ(render(description, false), expected);
}

TEST(ReportRendererTest, VerboseModel) {
    ModelDescription description = baseDescription("8B");
    description.parameters = "\n\t\t\tstop up";
    description.modelInfo["general.architecture"] = MetadataValue("test");
    description.modelInfo["general.parameter_count"] = MetadataValue(8000000000.0);
    description.modelInfo["some.true_bool"] = MetadataValue(true);
    description.modelInfo["some.false_bool"] = MetadataValue(false);
    description.modelInfo["test.context_length"] = MetadataValue(1000.0);
    description.modelInfo["test.embedding_length"] = MetadataValue(11434.0);
    description.tensors.push_back({"blk.0.attn_k.weight", "BF16", {42, 3117}});
    description.tensors.push_back({"blk.0.attn_q.weight", "FP16", {3117, 42}});

    const std::string expected =
        "  Model\n"
        "    architecture        test     \n"
        "    parameters          8B       \n"
        "    context length      1000     \n"
        "    embedding length    11434    \n"
        "    quantization        FP16     \n"
        "\n"
        "  Parameters\n"
        "    stop    up    \n"
        "\n"
        "  Metadata\n"
        "    general.architecture       test     \n"
        "    general.parameter_count    8e+09    \n"
        "    some.false_bool            false    \n"
        "    some.true_bool             true     \n"
        "    test.context_length        1000     \n"
        "    test.embedding_length      11434    \n"
        "\n"
        "  Tensors\n"
        "    blk.0.attn_k.weight    BF16    [42 3117]    \n"
        "    blk.0.attn_q.weight    FP16    [3117 42]    \n"
        "\n";
    EXPECT_EQ(render(description, true), expected);
}

TEST(ReportRendererTest, MetadataAndTensorsHiddenWhenNotVerbose) {
    ModelDescription description = baseDescription("7B");
    description.modelInfo["some.flag"] = MetadataValue(true);
    description.tensors.push_back({"output.weight", "Q4_K", {4096, 32000}});

    std::string output = render(description, false);
    EXPECT_EQ(output.find("Metadata"), std::string::npos);
    EXPECT_EQ(output.find("Tensors"), std::string::npos);
}

TEST(ReportRendererTest, Parameters) {
    ModelDescription description = baseDescription("7B");
    description.parameters =
        "\n\t\t\tstop never\n\t\t\tstop gonna\n\t\t\tstop give\n\t\t\tstop you\n\t\t\tstop up\n\t\t\ttemperature 99";

    const std::string expected = std::string(BARE_MODEL_SECTION) +
        "  Parameters\n"
        "    stop           never    \n"
        "    stop           gonna    \n"
        "    stop           give     \n"
        "    stop           you      \n"
        "    stop           up       \n"
        "    temperature    99       \n"
        "\n";
    EXPECT_EQ(render(description, false), expected);
}

TEST(ReportRendererTest, ProjectorInfo) {
    ModelDescription description = baseDescription("7B");
    description.projectorInfo["general.architecture"] = MetadataValue("clip");
    description.projectorInfo["general.parameter_count"] = MetadataValue(133700000.0);
    description.projectorInfo["clip.vision.embedding_length"] = MetadataValue(0.0);
    description.projectorInfo["clip.vision.projection_dim"] = MetadataValue(0.0);

    const std::string expected = std::string(BARE_MODEL_SECTION) +
        "  Projector\n"
        "    architecture        clip       \n"
        "    parameters          133.70M    \n"
        "    embedding length    0          \n"
        "    dimensions          0          \n"
        "\n";
    EXPECT_EQ(render(description, false), expected);
}

TEST(ReportRendererTest, SystemPreviewIsElided) {
    ModelDescription description = baseDescription("7B");
    description.system = "You are a pirate!\nAhoy, matey!\nWeigh anchor!\n\t\t\t";

    const std::string expected = std::string(BARE_MODEL_SECTION) +
        "  System\n"
        "    You are a pirate!    \n"
        "    Ahoy, matey!         \n"
        "    ...                  \n"
        "\n";
    EXPECT_EQ(render(description, false), expected);
}

TEST(ReportRendererTest, ShortSystemIsNotElided) {
    std::vector<TableRow> rows = ReportRenderer::previewRows("one\n\ntwo\n", 2);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0][0], "one");
    EXPECT_EQ(rows[1][0], "two");
}

TEST(ReportRendererTest, License) {
    ModelDescription description = baseDescription("7B");
    description.license = "MIT License\nCopyright (c) Ollama\n";

    const std::string expected = std::string(BARE_MODEL_SECTION) +
        "  License\n"
        "    MIT License             \n"
        "    Copyright (c) Ollama    \n"
        "\n";
    EXPECT_EQ(render(description, false), expected);
}

TEST(ReportRendererTest, Capabilities) {
    ModelDescription description = baseDescription("7B");
    description.capabilities = {"vision", "tools"};

    const std::string expected = std::string(BARE_MODEL_SECTION) +
        "  Capabilities\n"
        "    vision    \n"
        "    tools     \n"
        "\n";
    EXPECT_EQ(render(description, false), expected);
}

TEST(ReportRendererTest, AllSectionsInOrderAndStable) {
    ModelDescription description = baseDescription("7B");
    description.parameters = "stop up\ntemperature 0.7";
    description.modelInfo["general.architecture"] = MetadataValue("test");
    description.modelInfo["test.context_length"] = MetadataValue(2048.0);
    description.tensors.push_back({"output.weight", "F16", {8, 16}});
    description.projectorInfo["general.architecture"] = MetadataValue("clip");
    description.projectorInfo["general.parameter_count"] = MetadataValue(1000000.0);
    description.system = "Be brief.";
    description.license = "MIT";
    description.capabilities = {"completion", "vision"};

    const std::string expected =
        "  Model\n"
        "    architecture      test    \n"
        "    parameters        7B      \n"
        "    context length    2048    \n"
        "    quantization      FP16    \n"
        "\n"
        "  Parameters\n"
        "    stop           up     \n"
        "    temperature    0.7    \n"
        "\n"
        "  Metadata\n"
        "    general.architecture    test    \n"
        "    test.context_length     2048    \n"
        "\n"
        "  Tensors\n"
        "    output.weight    F16    [8 16]    \n"
        "\n"
        "  Projector\n"
        "    architecture    clip    \n"
        "    parameters      1M      \n"
        "\n"
        "  System\n"
        "    Be brief.    \n"
        "\n"
        "  License\n"
        "    MIT    \n"
        "\n"
        "  Capabilities\n"
        "    completion    \n"
        "    vision        \n"
        "\n";

    std::string first = render(description, true);
    std::string second = render(description, true);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, expected);
}

TEST(ReportRendererTest, ScaledParameterCountWhenSizeMissing) {
    ModelDescription description = baseDescription("");
    description.modelInfo["general.architecture"] = MetadataValue("llama");
    description.modelInfo["general.parameter_count"] = MetadataValue(8030261248.0);

    std::vector<TableRow> rows = ReportRenderer::modelRows(description);
    ASSERT_GE(rows.size(), 2u);
    EXPECT_EQ(rows[1][0], "parameters");
    EXPECT_EQ(rows[1][1], "8.0B");
}

TEST(ReportRendererTest, ArchitecturePrefersMetadataOverFamily) {
    ModelDescription description = baseDescription("7B");
    description.modelInfo["general.architecture"] = MetadataValue("qwen2");

    std::vector<TableRow> rows = ReportRenderer::modelRows(description);
    EXPECT_EQ(rows[0][1], "qwen2");
}

TEST(ReportRendererTest, ParameterLineWithoutValue) {
    std::vector<TableRow> rows = ReportRenderer::parameterRows("num_ctx  4096\nflag\n\n");
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0], (TableRow{"num_ctx", "4096"}));
    EXPECT_EQ(rows[1], (TableRow{"flag"}));
}

TEST(ReportRendererTest, LicenseKeepsInteriorBlankLines) {
    std::vector<TableRow> rows = ReportRenderer::textRows("Terms\n\nMore terms  \n\n\n");
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[1][0], "");
    EXPECT_EQ(rows[2][0], "More terms");
}

TEST(ReportRendererTest, FormatShape) {
    EXPECT_EQ(ReportRenderer::formatShape({}), "[]");
    EXPECT_EQ(ReportRenderer::formatShape({4096}), "[4096]");
    EXPECT_EQ(ReportRenderer::formatShape({42, 3117}), "[42 3117]");
}

TEST(ReportRendererTest, FailedStreamReportsError) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    std::string errorMessage;
    EXPECT_FALSE(ReportRenderer::render(baseDescription("7B"), false, out, errorMessage));
    EXPECT_EQ(errorMessage, "failed to write Model section");
}

TEST(ReportRendererTest, ModelListFiltersByPrefix) {
    std::vector<ModelSummary> models(2);
    models[0].name = "llama3:8b";
    models[0].digest = "365c0bd3c000a25d28ddbf732fe1c6add414de7275464c4e4d1c3b5fcb5d8ad1";
    models[0].size = 4661224676LL;
    models[0].modifiedAt = "2024-05-01T10:00:00Z";
    models[1].name = "qwen2:7b";
    models[1].digest = "dd314f039b9d";
    models[1].size = 4400000000LL;
    models[1].modifiedAt = "not a time";

    std::chrono::system_clock::time_point now;
    ASSERT_TRUE(NumberFormat::parseTimestamp("2024-05-03T10:00:00Z", now));

    std::ostringstream out;
    std::string errorMessage;
    ASSERT_TRUE(ReportRenderer::renderModelList(models, "llama", now, out, errorMessage));

    const std::string expected =
        "NAME         ID              SIZE      MODIFIED      \n"
        "llama3:8b    365c0bd3c000    4.7 GB    2 days ago    \n";
    EXPECT_EQ(out.str(), expected);
}

TEST(ReportRendererTest, ModelListUnparsableTimeIsNever) {
    std::vector<ModelSummary> models(1);
    models[0].name = "a";
    models[0].digest = "abc";
    models[0].size = 12;
    models[0].modifiedAt = "";

    std::ostringstream out;
    std::string errorMessage;
    ASSERT_TRUE(ReportRenderer::renderModelList(models, "", std::chrono::system_clock::now(), out, errorMessage));
    EXPECT_NE(out.str().find("Never"), std::string::npos);
    EXPECT_NE(out.str().find("12 B"), std::string::npos);
}
