/**
 * pgxrisk - Main Entry Point
 *
 * Per-drug pharmacogenomic risk assessment from a single-sample VCF.
 * Outputs are advisory and not a clinical-grade diagnosis.
 */

#include "pipeline.hpp"
#include "report_writer.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

void print_usage(const char* program_name) {
    std::cout << "pgxrisk - Pharmacogenomic Risk Assessment\n"
              << "=========================================\n\n"
              << "Usage: " << program_name << " --vcf FILE --drugs LIST [OPTIONS]\n\n"
              << "Input:\n"
              << "  --vcf FILE              Single-sample VCF (.vcf or .vcf.gz), '-' for stdin\n"
              << "  --drugs LIST            Comma-separated drug names (e.g. codeine,warfarin)\n"
              << "  --patient-id ID         Patient identifier (default: PATIENT_<vcf name>)\n\n"
              << "Knowledge Base and Model:\n"
              << "  --kb-dir DIR            Override built-in tables with any of genes.tsv,\n"
              << "                          pgx_variants.tsv, phenotype_bands.tsv, drugs.tsv,\n"
              << "                          risk_rules.tsv found in DIR\n"
              << "  --model FILE            Classifier checkpoint (demo mode if absent or invalid)\n"
              << "  --config FILE           Pipeline settings (key=value)\n"
              << "  --no-ml                 Disable the neural fallback classifier\n\n"
              << "Flanking Sequence:\n"
              << "  --fasta FILE            Reference FASTA loaded into memory (.fa / .fa.gz)\n"
              << "  --faidx FILE            Indexed FASTA via htslib faidx\n"
              << "                          (default: synthetic per-position sequence)\n\n"
              << "Output Options:\n"
              << "  -o, --output FILE       Output file (default: stdout; .gz compresses)\n"
              << "  --format FORMAT         json (default) or tsv\n\n"
              << "Other Options:\n"
              << "  --status                Print model and knowledge base status, then exit\n"
              << "  -h, --help              Show this help message\n"
              << "  --debug                 Enable debug logging\n\n"
              << "Examples:\n"
              << "  " << program_name << " --vcf patient.vcf.gz --drugs codeine,clopidogrel\n"
              << "  " << program_name << " --vcf patient.vcf --drugs warfarin --model model.ckpt "
              << "--format tsv -o report.tsv\n"
              << std::endl;
}

std::vector<std::string> split_drug_list(const std::string& list) {
    std::vector<std::string> drugs;
    std::istringstream iss(list);
    std::string drug;
    while (std::getline(iss, drug, ',')) {
        drug.erase(0, drug.find_first_not_of(" \t"));
        drug.erase(drug.find_last_not_of(" \t") + 1);
        if (!drug.empty()) {
            drugs.push_back(drug);
        }
    }
    return drugs;
}

int main(int argc, char* argv[]) {
    std::string vcf_path;
    std::string drug_list;
    std::string patient_id;
    std::string model_path;
    std::string kb_dir;
    std::string config_path;
    std::string fasta_path;
    bool use_faidx = false;
    std::string output_path;
    std::string format = "json";
    bool no_ml = false;
    bool status_only = false;
    bool debug = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--vcf" && i + 1 < argc) {
            vcf_path = argv[++i];
        } else if (arg == "--drugs" && i + 1 < argc) {
            drug_list = argv[++i];
        } else if (arg == "--patient-id" && i + 1 < argc) {
            patient_id = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            model_path = argv[++i];
        } else if (arg == "--kb-dir" && i + 1 < argc) {
            kb_dir = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--fasta" && i + 1 < argc) {
            fasta_path = argv[++i];
            use_faidx = false;
        } else if (arg == "--faidx" && i + 1 < argc) {
            fasta_path = argv[++i];
            use_faidx = true;
        } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            format = argv[++i];
        } else if (arg == "--no-ml") {
            no_ml = true;
        } else if (arg == "--status") {
            status_only = true;
        } else if (arg == "--debug") {
            debug = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Set log level
    if (debug) {
        pgx::set_log_level(pgx::LogLevel::DEBUG);
    }

    if (!status_only && vcf_path.empty()) {
        std::cerr << "Error: --vcf is required.\n" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    try {
        pgx::OutputFormat output_format = pgx::parse_output_format(format);

        pgx::PipelineConfig config;
        if (!config_path.empty()) {
            config = pgx::PipelineConfig::load_file(config_path);
        }
        if (no_ml) {
            config.ml_fallback = false;
        }

        pgx::KnowledgeBase kb = kb_dir.empty() ? pgx::KnowledgeBase::builtin()
                                               : pgx::KnowledgeBase::load(kb_dir);

        auto model = pgx::ModelState::initialize_global(model_path);

        if (status_only) {
            pgx::RiskClassifier risk(kb.rules, kb.drug_genes, config.risk);
            std::cout << model->status_string();
            std::cout << "Knowledge base: " << kb.version << " ("
                      << kb.variants.size() << " curated variants, "
                      << kb.genes.size() << " genes)\n";
            std::cout << "Supported drugs:";
            for (const auto& drug : risk.supported_drugs()) {
                std::cout << " " << drug;
            }
            std::cout << std::endl;
            return 0;
        }

        auto source = pgx::create_sequence_source(fasta_path, use_faidx);
        pgx::Pipeline pipeline(kb, model, source, config);

        pgx::AnalysisRequest request;
        request.patient_id = patient_id;
        request.drugs = split_drug_list(drug_list);

        pgx::AnalysisResult result;
        if (vcf_path == "-") {
            result = pipeline.analyze(std::cin, request);
        } else {
            result = pipeline.analyze_file(vcf_path, request);
        }

        auto writer = pgx::create_report_writer(output_format, output_path);
        writer->write_header();
        writer->write_reports(result.reports);
        writer->write_footer();
        writer->close();

        pgx::log(pgx::LogLevel::INFO, "\n" + result.metrics.to_string());

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
