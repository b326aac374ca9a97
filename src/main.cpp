#include "stepdag/common/logging.hpp"
#include "stepdag/common/payload.inline.hpp"
#include "stepdag/pipeline/pipeline.hpp"
#include "stepdag/stores/local_stores.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace
{

using namespace stepdag;

/**
 * @brief Writes JSON-representable values to `<uri>/data.json`.
 */
class JsonMaterializer : public IMaterializer
{
public:
    Source source() const override
    {
        return Source("stepdag_demo.materializers", "JsonMaterializer");
    }

    std::vector<DataType> associated_types() const override
    {
        return {DataType::none(), DataType::boolean(), DataType::integer(), DataType::floating(),
                DataType::string(), DataType::list(), DataType::dict()};
    }

    std::string artifact_type() const override
    {
        return "DataArtifact";
    }

    std::string source_code() const override
    {
        return "class JsonMaterializer { save(uri, value) -> uri/data.json }";
    }

    void save(const std::string& uri, const Payload& value) override
    {
        std::ofstream out(std::filesystem::path(uri) / "data.json");
        if (!out)
        {
            throw std::runtime_error("Cannot write " + uri + "/data.json");
        }
        out << value.as<Json>().dump(2);
    }
};

} // namespace

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== stepdag ======\n" << std::flush;

        set_log_level(LogLevel::Info);

        auto registry = std::make_shared<MaterializerRegistry>();
        registry->register_materializer(std::make_shared<JsonMaterializer>());

        StepOptions options;
        options.materializer_registry = registry;

        auto load_data = make_step(
            EntrypointSignature{"load_data", {SignatureParameter("rows", TypeExpr(DataType::integer()))},
                                ReturnAnnotation::named({{"features", TypeExpr(DataType::list())},
                                                         {"labels", TypeExpr(DataType::list())}})},
            "def load_data(rows: int) -> Output(features=list, labels=list)",
            [](const std::map<std::string, Payload>& inputs) {
                auto rows = inputs.at("rows").as<Json>().get<int>();
                Json features = Json::array();
                Json labels = Json::array();
                for (int i = 0; i < rows; ++i)
                {
                    features.push_back(i);
                    labels.push_back(i % 2);
                }
                return std::map<std::string, Payload>{{"features", Payload::from_json(features)},
                                                      {"labels", Payload::from_json(labels)}};
            },
            options);

        auto train = make_step(
            EntrypointSignature{"train",
                                {SignatureParameter("features", TypeExpr(DataType::list())),
                                 SignatureParameter("labels", TypeExpr(DataType::list())),
                                 SignatureParameter("vocabulary", TypeExpr(DataType::dict())),
                                 SignatureParameter("learning_rate", TypeExpr(DataType::floating()), Json(0.01))},
                                ReturnAnnotation::single(TypeExpr::optional(TypeExpr(DataType::floating())))},
            "def train(features: list, labels: list, vocabulary: dict, learning_rate: float = 0.01) -> Optional[float]",
            nullptr,
            options);

        Pipeline pipeline("demo_pipeline");
        pipeline.build([&](Pipeline& p) {
            auto data = load_data->invoke(p, StepCallArguments{{Json(8)}, {}});
            auto vocabulary = ExternalArtifact::from_value(Payload::from_json(Json{{"a", 0}, {"b", 1}}));
            train->invoke(p, StepCallArguments{{data[0], data[1]}, {{"vocabulary", vocabulary}}});
        });

        std::string root = (std::filesystem::temp_directory_path() / "stepdag_demo_store").string();
        FinalizationContext context;
        context.materializers = registry;
        context.artifact_store = std::make_shared<LocalArtifactStore>(root);
        context.metadata_store = std::make_shared<InMemoryMetadataStore>();
        context.run = RunContext{"demo_user", "default", "local_store"};

        auto graph = pipeline.finalize(context);
        std::cout << Json(*graph).dump(2) << "\n" << std::flush;

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
