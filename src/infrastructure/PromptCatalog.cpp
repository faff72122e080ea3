#include "infrastructure/PromptCatalog.hpp"

namespace beplanner::infrastructure {

std::string PromptCatalog::GetExtractionPrompt(const std::string& inn) {
    return
        "You are a clinical pharmacologist extracting pharmacokinetic parameters of " + inn +
        " from a scientific abstract.\n\n"
        "STANDARD UNITS (convert every value before reporting it):\n"
        "- Cmax: ng/mL\n"
        "- AUC: ng*h/mL\n"
        "- Tmax: h\n"
        "- T1/2: h\n"
        "- CV_intra: % (percent, e.g. 15.5 and not 0.155)\n\n"
        "RULES:\n"
        "1. CV_intra is the INTRA-subject (within-subject) coefficient of variation. Never report inter-subject variability.\n"
        "2. Prefer values measured in healthy volunteers.\n"
        "3. Convert units with standard factors (1 mg/L = 1000 ng/mL, 1 ug/mL = 1000 ng/mL, minutes / 60 = h).\n"
        "4. If a value cannot be converted to its standard unit, report it as not found.\n"
        "5. Report only numbers present in the text. Do not estimate.\n\n"
        "Answer with a single JSON object and nothing else:\n"
        "{\n"
        "  \"Cmax\": {\"value\": <number|null>, \"unit\": \"ng/mL\", \"found\": <bool>, \"converted\": <bool>},\n"
        "  \"AUC\": {\"value\": <number|null>, \"unit\": \"ng*h/mL\", \"found\": <bool>, \"converted\": <bool>},\n"
        "  \"Tmax\": {\"value\": <number|null>, \"unit\": \"h\", \"found\": <bool>, \"converted\": <bool>},\n"
        "  \"T1/2\": {\"value\": <number|null>, \"unit\": \"h\", \"found\": <bool>, \"converted\": <bool>},\n"
        "  \"CV_intra\": {\"value\": <number|null>, \"unit\": \"%\", \"found\": <bool>, \"converted\": <bool>}\n"
        "}";
}

std::string PromptCatalog::GetCvIntraPrompt(const std::string& inn) {
    return
        "You are a bioequivalence statistician. Extract ONLY the intra-subject variability of " + inn +
        " from the text.\n\n"
        "Treat these as CV_intra: intra-subject CV, within-subject CV, intrasubject variability, "
        "residual variability of a crossover bioequivalence study.\n"
        "Never use inter-subject or between-subject variability.\n\n"
        "Answer with a single JSON object and nothing else:\n"
        "{\"CV_intra\": {\"value\": <number|null>, \"unit\": \"%\", \"found\": <bool>, \"converted\": <bool>}}";
}

std::string PromptCatalog::BuildDocumentMessage(const std::string& documentText) {
    return "Extract the parameters from this abstract:\n\n" + documentText;
}

} // namespace beplanner::infrastructure
