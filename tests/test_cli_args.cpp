// Unit tests for subcommand argument parsing

#undef NDEBUG
#include "cli/args.hpp"
#include <cassert>
#include <cstring>
#include <cstdlib>
#include <iostream>
#include <vector>

using degen::cli::Command;

class ArgvBuilder {
public:
    ArgvBuilder& add(const char* arg) {
        args_.push_back(strdup(arg));
        return *this;
    }

    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return args_.data(); }

    ~ArgvBuilder() {
        for (char* arg : args_) {
            std::free(arg);
        }
    }

private:
    std::vector<char*> args_;
};

static void expect_parse_exit(int expected_code, Command cmd, ArgvBuilder& builder) {
    bool threw = false;
    try {
        (void)degen::cli::parse_args(cmd, builder.argc(), builder.argv());
    } catch (const degen::cli::ParseArgsExit& e) {
        threw = true;
        assert(e.exit_code() == expected_code);
    }
    assert(threw);
}

void test_analyze_args() {
    std::cout << "Testing analyze args... ";
    ArgvBuilder builder;
    builder.add("analyze").add("NNK").add("nns").add("--tsv").add("-o").add("out.tsv").add("-v");
    auto opts = degen::cli::parse_args(Command::ANALYZE, builder.argc(), builder.argv());
    assert(opts.codes.size() == 2);
    assert(opts.codes[0] == "NNK");
    assert(opts.codes[1] == "nns");
    assert(opts.tsv == true);
    assert(opts.output_file == "out.tsv");
    assert(opts.verbose == true);
    std::cout << "PASSED\n";
}

void test_defaults() {
    std::cout << "Testing defaults... ";
    unsetenv("DEGEN_THREADS");
    ArgvBuilder builder;
    builder.add("catalog");
    auto opts = degen::cli::parse_args(Command::CATALOG, builder.argc(), builder.argv());
    assert(opts.output_file.empty());
    assert(opts.covers.empty());
    assert(opts.no_stop == false);
    assert(opts.max_codons == 64);
    assert(opts.num_threads == 0);
    assert(opts.tsv == false);
    assert(opts.verbose == false);
    assert(opts.strategy == degen::Strategy::MINIMAL);
    std::cout << "PASSED\n";
}

void test_library_args() {
    std::cout << "Testing library args... ";
    {
        ArgvBuilder builder;
        builder.add("library").add("-i").add("positions.txt.gz");
        auto opts = degen::cli::parse_args(Command::LIBRARY, builder.argc(), builder.argv());
        assert(opts.input_file == "positions.txt.gz");
        assert(opts.codes.empty());
    }
    {
        ArgvBuilder builder;
        builder.add("library").add("-");
        auto opts = degen::cli::parse_args(Command::LIBRARY, builder.argc(), builder.argv());
        assert(opts.input_file == "-");
    }
    {
        ArgvBuilder builder;
        builder.add("library");
        auto opts = degen::cli::parse_args(Command::LIBRARY, builder.argc(), builder.argv());
        assert(opts.codes.empty());
        assert(opts.input_file.empty());
    }
    std::cout << "PASSED\n";
}

void test_design_args() {
    std::cout << "Testing design args... ";
    {
        ArgvBuilder builder;
        builder.add("design").add("DEKR").add("--strategy").add("Balanced");
        auto opts = degen::cli::parse_args(Command::DESIGN, builder.argc(), builder.argv());
        assert(opts.amino_acids == "DEKR");
        assert(opts.strategy == degen::Strategy::BALANCED);
    }
    {
        ArgvBuilder builder;
        builder.add("design").add("-s").add("all").add("AG");
        auto opts = degen::cli::parse_args(Command::DESIGN, builder.argc(), builder.argv());
        assert(opts.amino_acids == "AG");
        assert(opts.strategy == degen::Strategy::ALL);
    }
    std::cout << "PASSED\n";
}

void test_catalog_args() {
    std::cout << "Testing catalog args... ";
    {
        ArgvBuilder builder;
        builder.add("catalog").add("--covers").add("FYW").add("--no-stop")
               .add("--max-codons").add("12").add("-t").add("4");
        auto opts = degen::cli::parse_args(Command::CATALOG, builder.argc(), builder.argv());
        assert(opts.covers == "FYW");
        assert(opts.no_stop == true);
        assert(opts.max_codons == 12);
        assert(opts.num_threads == 4);
    }
    {
        setenv("DEGEN_THREADS", "3", 1);
        ArgvBuilder builder;
        builder.add("catalog");
        auto opts = degen::cli::parse_args(Command::CATALOG, builder.argc(), builder.argv());
        assert(opts.num_threads == 3);
        unsetenv("DEGEN_THREADS");
    }
    std::cout << "PASSED\n";
}

void test_validation_errors() {
    std::cout << "Testing validation errors... ";
    {
        ArgvBuilder builder;
        builder.add("analyze");
        expect_parse_exit(1, Command::ANALYZE, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("design").add("AG").add("KR");
        expect_parse_exit(1, Command::DESIGN, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("design").add("AG").add("--strategy").add("greedy");
        expect_parse_exit(1, Command::DESIGN, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("library").add("NNK").add("-i").add("positions.txt");
        expect_parse_exit(1, Command::LIBRARY, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("catalog").add("--threads").add("0");
        expect_parse_exit(1, Command::CATALOG, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("catalog").add("--max-codons").add("x");
        expect_parse_exit(1, Command::CATALOG, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("catalog").add("NNK");
        expect_parse_exit(1, Command::CATALOG, builder);
    }
    {
        // Catalog-only flag rejected elsewhere
        ArgvBuilder builder;
        builder.add("analyze").add("NNK").add("--no-stop");
        expect_parse_exit(1, Command::ANALYZE, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("analyze").add("NNK").add("-o");
        expect_parse_exit(1, Command::ANALYZE, builder);
    }
    std::cout << "PASSED\n";
}

void test_controlled_exits() {
    std::cout << "Testing help controlled exits... ";
    {
        ArgvBuilder builder;
        builder.add("analyze").add("--help");
        expect_parse_exit(0, Command::ANALYZE, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("design").add("-h");
        expect_parse_exit(0, Command::DESIGN, builder);
    }
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== CLI Argument Parsing Tests ===\n\n";
    test_analyze_args();
    test_defaults();
    test_library_args();
    test_design_args();
    test_catalog_args();
    test_validation_errors();
    test_controlled_exits();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
