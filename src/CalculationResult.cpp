#include "CalculationResult.hpp"

namespace VetCalc {

namespace {

struct TypeVisitor {
    CalculationType operator()(const DoseResult&) const { return CalculationType::DOSE; }
    CalculationType operator()(const SolutionResult&) const { return CalculationType::SOLUTION; }
    CalculationType operator()(const DilutionResult&) const { return CalculationType::DILUTION; }
    CalculationType operator()(const BufferResult&) const { return CalculationType::BUFFER; }
    CalculationType operator()(const ConversionResult&) const { return CalculationType::CONVERSION; }
};

} // namespace

CalculationType resultType(const CalculationResult& result) {
    return std::visit(TypeVisitor{}, result);
}

} // namespace VetCalc
