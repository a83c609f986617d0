/**
 * @file cmd_iupac.cpp
 * @brief IUPAC nucleotide code reference.
 */

#include "subcommand.hpp"
#include "degen/codon_tables.hpp"

#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>

namespace degen {
namespace cli {

int cmd_iupac(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            std::cout << "Usage: degen iupac\n\nPrint the IUPAC nucleotide code table.\n";
            return 0;
        }
        std::cerr << "Error: Unknown option: " << argv[i] << "\n";
        return 1;
    }

    std::cout << std::left << std::setw(6) << "Code" << std::setw(10) << "Bases" << "Meaning\n";
    for (const auto& e : iupac_table()) {
        std::string bases;
        for (Nucleotide nt : members(e.bases)) {
            if (!bases.empty()) bases += '/';
            bases += nt_to_char(nt);
        }
        std::cout << std::setw(6) << e.code << std::setw(10) << bases << e.mnemonic << "\n";
    }
    std::cout << "\nCommon library codes:\n"
              << "  NNK  32 codons, 20 amino acids + 1 stop (TAG)\n"
              << "  NNS  32 codons, 20 amino acids + 1 stop (TAG)\n"
              << "  NNN  64 codons, 20 amino acids + 3 stops\n"
              << "  NDT  12 codons, 12 amino acids, no stop\n";
    return 0;
}

namespace {
    struct IupacRegistrar {
        IupacRegistrar() {
            SubcommandRegistry::instance().register_command(
                "iupac",
                "IUPAC nucleotide code reference",
                cmd_iupac, 50);
        }
    };
    static IupacRegistrar registrar;
}

}  // namespace cli
}  // namespace degen
