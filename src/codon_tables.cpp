/**
 * Standard genetic code
 *
 * Encoding: T/U=0, C=1, A=2, G=3
 * Index = base1*16 + base2*4 + base3
 */

#include "nucleo/codon_tables.hpp"
#include <array>

namespace nucleo {

// Codon to amino acid translation table
static const std::array<char, 64> STANDARD_CODE = []() {
    std::array<char, 64> arr{};

    // UUx: Phe, Phe, Leu, Leu
    arr[0] = 'F'; arr[1] = 'F'; arr[2] = 'L'; arr[3] = 'L';
    // UCx: Ser
    arr[4] = 'S'; arr[5] = 'S'; arr[6] = 'S'; arr[7] = 'S';
    // UAx: Tyr, Tyr, Stop, Stop
    arr[8] = 'Y'; arr[9] = 'Y'; arr[10] = '*'; arr[11] = '*';
    // UGx: Cys, Cys, Stop, Trp
    arr[12] = 'C'; arr[13] = 'C'; arr[14] = '*'; arr[15] = 'W';

    // CUx: Leu
    arr[16] = 'L'; arr[17] = 'L'; arr[18] = 'L'; arr[19] = 'L';
    // CCx: Pro
    arr[20] = 'P'; arr[21] = 'P'; arr[22] = 'P'; arr[23] = 'P';
    // CAx: His, His, Gln, Gln
    arr[24] = 'H'; arr[25] = 'H'; arr[26] = 'Q'; arr[27] = 'Q';
    // CGx: Arg
    arr[28] = 'R'; arr[29] = 'R'; arr[30] = 'R'; arr[31] = 'R';

    // AUx: Ile, Ile, Ile, Met
    arr[32] = 'I'; arr[33] = 'I'; arr[34] = 'I'; arr[35] = 'M';
    // ACx: Thr
    arr[36] = 'T'; arr[37] = 'T'; arr[38] = 'T'; arr[39] = 'T';
    // AAx: Asn, Asn, Lys, Lys
    arr[40] = 'N'; arr[41] = 'N'; arr[42] = 'K'; arr[43] = 'K';
    // AGx: Ser, Ser, Arg, Arg
    arr[44] = 'S'; arr[45] = 'S'; arr[46] = 'R'; arr[47] = 'R';

    // GUx: Val
    arr[48] = 'V'; arr[49] = 'V'; arr[50] = 'V'; arr[51] = 'V';
    // GCx: Ala
    arr[52] = 'A'; arr[53] = 'A'; arr[54] = 'A'; arr[55] = 'A';
    // GAx: Asp, Asp, Glu, Glu
    arr[56] = 'D'; arr[57] = 'D'; arr[58] = 'E'; arr[59] = 'E';
    // GGx: Gly
    arr[60] = 'G'; arr[61] = 'G'; arr[62] = 'G'; arr[63] = 'G';

    return arr;
}();

const GeneticCode& GeneticCode::standard() {
    static const GeneticCode code(STANDARD_CODE);
    return code;
}

} // namespace nucleo
