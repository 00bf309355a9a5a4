#include "errors.hpp"

namespace binexp {

InvalidOperatorError::InvalidOperatorError(std::string symbol, std::size_t position)
    : ExpressionError("Неподдерживаемая операция '" + symbol + "' в токене " +
                      std::to_string(position)),
      operatorSymbol(std::move(symbol)),
      tokenPosition(position) {}

} // namespace binexp
