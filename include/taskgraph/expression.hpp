// EN: Value expressions: literal text, $(NAME) references and $(shell ...) extractions.
// FR: Expressions de valeur : texte littéral, références $(NOM) et extractions $(shell ...).

#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace PHR {
namespace TaskGraph {

struct Expression;

struct LiteralSegment {
    std::string text;
};

struct ReferenceSegment {
    std::string name;
};

// EN: The command is itself an expression, so $(shell cat ${FILE}) works.
// FR: La commande est elle-même une expression, donc $(shell cat ${FILE}) fonctionne.
struct ExtractionSegment {
    std::shared_ptr<const Expression> command;
};

using ExpressionSegment = std::variant<LiteralSegment, ReferenceSegment, ExtractionSegment>;

// EN: Concatenation of segments. Adjacent literals are always merged by the parser.
// FR: Concaténation de segments. Le parseur fusionne toujours les littéraux adjacents.
struct Expression {
    std::vector<ExpressionSegment> segments;

    static Expression literal(const std::string& text);

    bool empty() const { return segments.empty(); }
    bool isLiteral() const;

    // EN: Names referenced directly or inside extraction commands
    // FR: Noms référencés directement ou dans les commandes d'extraction
    std::vector<std::string> references() const;

    // EN: Source form, re-parseable ("$" written as "$$")
    // FR: Forme source, re-parsable ("$" écrit "$$")
    std::string toString() const;
};

// EN: Parse "$(NAME)", "${NAME}", "$(shell CMD)", "${shell CMD}" and "$$".
// EN: Any other '$' is literal. Throws TaskfileSyntaxError (line 0) on malformed input.
// FR: Parse "$(NOM)", "${NOM}", "$(shell CMD)", "${shell CMD}" et "$$".
// FR: Tout autre '$' est littéral. Lance TaskfileSyntaxError (ligne 0) si l'entrée est mal formée.
Expression parseExpression(const std::string& text);

} // namespace TaskGraph
} // namespace PHR
