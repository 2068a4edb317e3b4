#include "burst_engine.h"
#include "burst_loop_runner.h"
#include "config.h"
#include "morphology.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cortexlib;

struct SimulationParameters {
    uint64_t bursts;
    float frequency_hz;
    size_t threads;
    size_t shards;
    std::string precision;
    size_t ledger_capacity;
    uint64_t seed;
    std::string log_file;
    bool debug;

    SimulationParameters()
        : bursts(200), frequency_hz(0.0f), threads(1), shards(4), precision("float32"),
          ledger_capacity(64), seed(12345), log_file("cortexsim.log"), debug(false) {}
};

static std::atomic<bool> interrupted(false);

static void handle_signal(int) {
    interrupted.store(true);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "Options:\n";
    std::cout << "  --bursts <N>        Number of bursts to run, 0 runs until interrupted (default: 200)\n";
    std::cout << "  --frequency <hz>    Target burst frequency, 0 is unthrottled (default: 0)\n";
    std::cout << "  --threads <N>       Worker threads (default: 1)\n";
    std::cout << "  --shards <N>        Fire candidate list shards (default: 4)\n";
    std::cout << "  --precision <name>  float32 or quantized16 (default: float32)\n";
    std::cout << "  --ledger <N>        Fire ledger depth in bursts (default: 64)\n";
    std::cout << "  --seed <N>          Random seed (default: 12345)\n";
    std::cout << "  --log-file <path>   Debug log file (default: cortexsim.log)\n";
    std::cout << "  --debug             Show debug output on the console\n";
    std::cout << "  --help              Show this help message\n";
}

SimulationParameters parse_command_line(int argc, char* argv[]) {
    SimulationParameters params;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            exit(0);
        } else if (arg == "--bursts" && i + 1 < argc) {
            params.bursts = std::stoull(argv[++i]);
        } else if (arg == "--frequency" && i + 1 < argc) {
            params.frequency_hz = std::stof(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            params.threads = std::stoul(argv[++i]);
        } else if (arg == "--shards" && i + 1 < argc) {
            params.shards = std::stoul(argv[++i]);
        } else if (arg == "--precision" && i + 1 < argc) {
            params.precision = argv[++i];
        } else if (arg == "--ledger" && i + 1 < argc) {
            params.ledger_capacity = std::stoul(argv[++i]);
        } else if (arg == "--seed" && i + 1 < argc) {
            params.seed = std::stoull(argv[++i]);
        } else if (arg == "--log-file" && i + 1 < argc) {
            params.log_file = argv[++i];
        } else if (arg == "--debug") {
            params.debug = true;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            exit(1);
        }
    }

    return params;
}

void validate_parameters(const SimulationParameters& params) {
    if (params.threads == 0) {
        throw std::invalid_argument("Thread count must be greater than 0");
    }
    if (params.shards == 0) {
        throw std::invalid_argument("Shard count must be greater than 0");
    }
    if (params.frequency_hz < 0.0f) {
        throw std::invalid_argument("Frequency must not be negative");
    }
    if (params.ledger_capacity == 0) {
        throw std::invalid_argument("Ledger depth must be greater than 0");
    }
}

void initialize_logging(const SimulationParameters& params) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(params.debug ? spdlog::level::debug : spdlog::level::info);
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(params.log_file, true);
        file_sink->set_level(spdlog::level::debug);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>("cortexsim",
                                                      spdlog::sinks_init_list{console_sink, file_sink});
        logger->set_level(spdlog::level::debug);
        spdlog::set_default_logger(logger);

        spdlog::debug("Debug logging enabled to file: {}", params.log_file);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

// Vision feeds a hidden layer, hidden drives a small motor strip, and a memory area
// learns recurring hidden/motor firing sets.
GenomeConfig build_demo_genome(const SimulationParameters& params) {
    GenomeConfig genome;

    CorticalAreaConfig vision("vision", Dimensions(16, 16, 1));
    vision.neuron.threshold = 0.8f;
    vision.neuron.refractory_period = 1;
    genome.areas.push_back(vision);

    CorticalAreaConfig hidden("hidden", Dimensions(8, 8, 2));
    hidden.neuron.threshold = 1.5f;
    hidden.neuron.leak_coefficient = 0.2f;
    hidden.neuron.consecutive_fire_limit = 3;
    hidden.neuron.snooze_period = 2;
    genome.areas.push_back(hidden);

    CorticalAreaConfig motor("motor", Dimensions(4, 8, 2), "integrate_fire");
    motor.neuron.threshold = 2.0f;
    motor.neuron.refractory_period = 2;
    genome.areas.push_back(motor);

    CorticalAreaConfig memory("memory", Dimensions(16, 16, 1), "memory");
    memory.populate = false;
    memory.neuron.threshold = 2.0f;
    genome.areas.push_back(memory);

    ProjectorMorphology projector;
    SynaptogenesisRuleConfig vision_to_hidden("vision", "hidden", projector);
    vision_to_hidden.synapse = SynapseParams(0.6f, 1.0f, SynapseType::EXCITATORY, true);
    genome.rules.push_back(vision_to_hidden);

    SynaptogenesisRuleConfig hidden_to_motor("hidden", "motor", BlockConnectionMorphology(2, Axis::X));
    hidden_to_motor.synapse = SynapseParams(0.9f, 1.0f, SynapseType::EXCITATORY, true);
    hidden_to_motor.attractivity = 80;
    genome.rules.push_back(hidden_to_motor);

    VectorsMorphology lateral;
    lateral.offsets = {Position(1, 0, 0), Position(-1, 0, 0)};
    SynaptogenesisRuleConfig hidden_lateral("hidden", "hidden", lateral);
    hidden_lateral.synapse = SynapseParams(0.3f, 1.0f, SynapseType::INHIBITORY);
    genome.rules.push_back(hidden_lateral);

    MemoryAreaConfig binding;
    binding.memory_area = "memory";
    binding.upstream_areas = {"hidden", "motor"};
    genome.plasticity.memory_areas.push_back(binding);

    genome.engine.precision = parse_precision(params.precision);
    genome.engine.ledger_capacity = params.ledger_capacity;
    genome.engine.worker_threads = params.threads;
    genome.engine.shard_count = params.shards;
    genome.engine.rng_seed = params.seed;
    genome.engine.target_frequency_hz = params.frequency_hz;
    return genome;
}

// A drifting bar across the vision area plus sparse noise
std::vector<SensoryInput> generate_inputs(uint64_t step, std::mt19937_64& rng) {
    std::vector<SensoryInput> inputs;
    int32_t column = static_cast<int32_t>(step % 16);
    for (int32_t y = 0; y < 16; ++y) {
        inputs.push_back(SensoryInput::at_position("vision", Position(column, y, 0), 1.0f));
    }
    std::uniform_int_distribution<int32_t> coordinate(0, 15);
    std::uniform_real_distribution<float> strength(0.2f, 1.0f);
    for (int i = 0; i < 8; ++i) {
        inputs.push_back(SensoryInput::at_position("vision", Position(coordinate(rng), coordinate(rng), 0),
                                                   strength(rng)));
    }
    return inputs;
}

int main(int argc, char* argv[]) {
    try {
        SimulationParameters params = parse_command_line(argc, argv);
        validate_parameters(params);
        initialize_logging(params);

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        BurstEngine engine(build_demo_genome(params));
        BurstLoopRunner runner(engine, params.frequency_hz);

        std::mt19937_64 rng(params.seed);
        uint64_t total_fired = 0;
        uint64_t total_errors = 0;
        runner.set_report_callback([&](const BurstReport& report) {
            total_fired += report.fired_count;
            total_errors += report.errors.size();
            if (report.plasticity.memory_neurons_created > 0) {
                spdlog::info("Burst {}: {} new memory neurons", report.index,
                             report.plasticity.memory_neurons_created);
            }
        });

        uint64_t step = 0;
        while (!interrupted.load() && (params.bursts == 0 || step < params.bursts)) {
            engine.intake_queue().push_batch(generate_inputs(step, rng));
            runner.run_bursts(1);
            ++step;
        }

        BurstSnapshot snapshot = engine.snapshot();
        spdlog::info("Ran {} bursts: {} neurons fired in total, {} burst errors",
                     snapshot.burst_count, total_fired, total_errors);
        spdlog::info("Final connectome: {} neurons, {} synapses, {} memory neurons",
                     snapshot.neuron_count, snapshot.synapse_count, engine.memory_neuron_count());
        if (engine.intake_queue().dropped_count() > 0) {
            spdlog::warn("Intake queue dropped {} inputs", engine.intake_queue().dropped_count());
        }
        spdlog::shutdown();
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("cortexsim failed: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
