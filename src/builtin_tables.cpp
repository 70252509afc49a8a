/**
 * Built-in knowledge-base tables (hg38, CPIC / PharmVar)
 */

#include "knowledge_base.hpp"

namespace pgx {
namespace builtin_tables {

const char* const kGenes =
    "##version=pgxrisk-kb-2024.1\n"
    "#gene\tchrom\tstart\tend\tdefault_star\tdefault_function\tdefault_activity\tcombine\n"
    "CYP2D6\t22\t42512000\t42530000\t*1\tnormal\t1.0\tsum\n"
    "CYP2C19\t10\t94762000\t94855000\t*1\tnormal\t1.0\tsum\n"
    "CYP2C9\t10\t96698000\t96749000\t*1\tnormal\t1.0\tsum\n"
    "SLCO1B1\t12\t21131000\t21239000\t*1a\tnormal\t1.0\tsum\n"
    "TPMT\t6\t18126000\t18157000\t*1\tnormal\t1.0\tsum\n"
    "DPYD\t1\t97543000\t98387000\t*1\tnormal\t1.0\tsum\n";

const char* const kVariants =
    "#gene\tchrom\tpos\tref\talt\tstar_allele\trsid\tfunction\tactivity\tsource\n"
    // CYP2D6
    "CYP2D6\t22\t42524947\tC\tT\t*4\trs3892097\tno_function\t0.0\tPharmVar\n"
    "CYP2D6\t22\t42525772\tG\tC\t*2\trs16947\tnormal\t1.0\tPharmVar\n"
    "CYP2D6\t22\t42527613\tC\tT\t*10\trs1065852\tdecreased\t0.25\tPharmVar\n"
    "CYP2D6\t22\t42523805\tC\tT\t*17\trs28371706\tdecreased\t0.5\tPharmVar\n"
    "CYP2D6\t22\t42522612\tG\tA\t*41\trs28371725\tdecreased\t0.5\tPharmVar\n"
    "CYP2D6\t22\t42524214\tA\tG\t*1xN\trs5030655\tincreased\t2.0\tPharmVar\n"
    // CYP2C19
    "CYP2C19\t10\t94781859\tG\tA\t*2\trs4244285\tno_function\t0.0\tPharmVar\n"
    "CYP2C19\t10\t94780573\tG\tA\t*3\trs4986893\tno_function\t0.0\tPharmVar\n"
    "CYP2C19\t10\t94761900\tC\tT\t*17\trs12248560\tincreased\t1.5\tPharmVar\n"
    // CYP2C9
    "CYP2C9\t10\t96741053\tC\tT\t*2\trs1799853\tdecreased\t0.5\tPharmVar\n"
    "CYP2C9\t10\t96740981\tA\tC\t*3\trs1057910\tno_function\t0.0\tPharmVar\n"
    "CYP2C9\t10\t96741058\tC\tG\t*5\trs28371686\tdecreased\t0.5\tPharmVar\n"
    "CYP2C9\t10\t96741048\tA\tdel\t*6\trs9332131\tno_function\t0.0\tPharmVar\n"
    // SLCO1B1
    "SLCO1B1\t12\t21178615\tT\tC\t*5\trs4149056\tdecreased\t0.0\tCPIC\n"
    "SLCO1B1\t12\t21176804\tA\tG\t*15\trs2306283\tdecreased\t0.0\tCPIC\n"
    // TPMT
    "TPMT\t6\t18130943\tG\tC\t*2\trs1800462\tno_function\t0.0\tPharmVar\n"
    "TPMT\t6\t18130918\tC\tT\t*3B\trs1800460\tno_function\t0.0\tPharmVar\n"
    "TPMT\t6\t18131006\tA\tG\t*3C\trs1142345\tno_function\t0.0\tPharmVar\n"
    // DPYD
    "DPYD\t1\t97915614\tC\tT\t*2A\trs3918290\tno_function\t0.0\tCPIC\n"
    "DPYD\t1\t97981395\tT\tG\t*13\trs56038477\tno_function\t0.0\tCPIC\n"
    "DPYD\t1\t98348885\tA\tT\tc.2846A>T\trs67376798\tdecreased\t0.5\tCPIC\n"
    "DPYD\t1\t97883329\tG\tA\tHapB3\trs75017182\tdecreased\t0.5\tCPIC\n";

// Upper bounds are inclusive; "-" marks the open top band
const char* const kPhenotypeBands =
    "#gene\tphenotype\tupper\n"
    "CYP2D6\tPM\t0.0\n"
    "CYP2D6\tIM\t1.0\n"
    "CYP2D6\tNM\t2.25\n"
    "CYP2D6\tUM\t-\n"
    "CYP2C19\tPM\t0.5\n"
    "CYP2C19\tIM\t1.5\n"
    "CYP2C19\tNM\t2.0\n"
    "CYP2C19\tUM\t-\n"
    "CYP2C9\tPM\t0.5\n"
    "CYP2C9\tIM\t1.5\n"
    "CYP2C9\tNM\t2.0\n"
    "CYP2C9\tUM\t-\n"
    "DPYD\tPM\t0.5\n"
    "DPYD\tIM\t1.5\n"
    "DPYD\tNM\t2.0\n"
    "DPYD\tUM\t-\n"
    "TPMT\tPM\t0.5\n"
    "TPMT\tIM\t1.5\n"
    "TPMT\tNM\t-\n"
    "SLCO1B1\tPF\t0.5\n"
    "SLCO1B1\tDF\t1.5\n"
    "SLCO1B1\tNF\t-\n";

const char* const kDrugs =
    "#drug\tgene\n"
    "CODEINE\tCYP2D6\n"
    "WARFARIN\tCYP2C9\n"
    "CLOPIDOGREL\tCYP2C19\n"
    "SIMVASTATIN\tSLCO1B1\n"
    "AZATHIOPRINE\tTPMT\n"
    "FLUOROURACIL\tDPYD\n";

const char* const kRiskRules =
    "#drug\tgene\tphenotype\tlabel\tconfidence\tsource\trecommendation\n"
    // Codeine: prodrug activated by CYP2D6
    "CODEINE\tCYP2D6\tUM\tToxic\t0.97\tCPIC\t"
        "Avoid codeine. Ultrarapid CYP2D6 activity converts codeine to morphine too quickly "
        "and risks life-threatening respiratory depression. Use a non-opioid analgesic or a "
        "non-codeine opioid with monitoring.\n"
    "CODEINE\tCYP2D6\tNM\tSafe\t0.95\tCPIC\t"
        "Use the standard codeine dose. Monitor for usual opioid side effects.\n"
    "CODEINE\tCYP2D6\tIM\tAdjust Dosage\t0.90\tCPIC\t"
        "Reduced CYP2D6 activity may blunt analgesia at standard doses. Consider a lower dose "
        "or an analgesic that does not depend on CYP2D6.\n"
    "CODEINE\tCYP2D6\tPM\tIneffective\t0.97\tCPIC\t"
        "Avoid codeine. Codeine is not converted to morphine and analgesia is expected to fail. "
        "Prescribe an opioid that is not a prodrug.\n"
    // Clopidogrel: prodrug activated by CYP2C19
    "CLOPIDOGREL\tCYP2C19\tUM\tAdjust Dosage\t0.85\tCPIC\t"
        "The standard clopidogrel dose is likely adequate. Monitor platelet reactivity if the "
        "response appears insufficient.\n"
    "CLOPIDOGREL\tCYP2C19\tNM\tSafe\t0.95\tCPIC\t"
        "Use standard clopidogrel dosing.\n"
    "CLOPIDOGREL\tCYP2C19\tIM\tIneffective\t0.88\tCPIC\t"
        "Clopidogrel activation is reduced. Consider prasugrel or ticagrelor to prevent stent "
        "thrombosis and cardiovascular events.\n"
    "CLOPIDOGREL\tCYP2C19\tPM\tIneffective\t0.97\tCPIC\t"
        "Avoid clopidogrel. The prodrug is not adequately activated and the risk of stent "
        "thrombosis or stroke is high. Prescribe prasugrel or ticagrelor.\n"
    // Warfarin: cleared by CYP2C9
    "WARFARIN\tCYP2C9\tUM\tAdjust Dosage\t0.85\tCPIC\t"
        "Warfarin may be cleared rapidly. Consider a higher initial dose with close INR "
        "monitoring.\n"
    "WARFARIN\tCYP2C9\tNM\tSafe\t0.95\tCPIC\t"
        "Use the standard warfarin dosing algorithm with routine INR monitoring.\n"
    "WARFARIN\tCYP2C9\tIM\tAdjust Dosage\t0.90\tCPIC\t"
        "Reduce the warfarin starting dose by 25-50%. Monitor INR closely during initiation.\n"
    "WARFARIN\tCYP2C9\tPM\tToxic\t0.95\tCPIC\t"
        "Reduce the warfarin starting dose by at least 50%. Slow clearance leads to "
        "accumulation and severe bleeding risk. Intensive INR monitoring is required.\n"
    // Simvastatin: hepatic uptake by SLCO1B1
    "SIMVASTATIN\tSLCO1B1\tNF\tSafe\t0.94\tCPIC\t"
        "Use the standard simvastatin dose.\n"
    "SIMVASTATIN\tSLCO1B1\tDF\tToxic\t0.90\tCPIC\t"
        "Avoid simvastatin at 40 mg/day or more. Reduced hepatic uptake raises systemic "
        "exposure and the risk of myopathy. Consider pravastatin or rosuvastatin.\n"
    "SIMVASTATIN\tSLCO1B1\tPF\tToxic\t0.96\tCPIC\t"
        "Avoid simvastatin. Plasma statin levels are markedly elevated with a high risk of "
        "rhabdomyolysis. Prescribe a low-risk statin at a conservative dose.\n"
    // Azathioprine: inactivated by TPMT
    "AZATHIOPRINE\tTPMT\tNM\tSafe\t0.95\tCPIC\t"
        "Use standard azathioprine or mercaptopurine dosing.\n"
    "AZATHIOPRINE\tTPMT\tIM\tAdjust Dosage\t0.90\tCPIC\t"
        "Reduce the azathioprine starting dose by 30-70% and monitor blood counts closely.\n"
    "AZATHIOPRINE\tTPMT\tPM\tToxic\t0.98\tCPIC\t"
        "Avoid azathioprine or reduce the dose by at least 90%. Thiopurine nucleotides "
        "accumulate and cause severe myelosuppression. Consider an alternative "
        "immunosuppressant.\n"
    // Fluorouracil: cleared by DPYD
    "FLUOROURACIL\tDPYD\tNM\tSafe\t0.95\tCPIC\t"
        "Use standard fluorouracil dosing. Monitor for common 5-FU toxicities.\n"
    "FLUOROURACIL\tDPYD\tIM\tAdjust Dosage\t0.90\tCPIC\t"
        "Reduce the fluorouracil starting dose by 25-50%. Slower clearance raises the risk "
        "of mucositis and neutropenia.\n"
    "FLUOROURACIL\tDPYD\tPM\tToxic\t0.98\tCPIC\t"
        "Avoid fluorouracil and capecitabine. Absent DPYD activity causes severe, potentially "
        "fatal toxicity. Choose a non-fluoropyrimidine regimen.\n";

} // namespace builtin_tables
} // namespace pgx
