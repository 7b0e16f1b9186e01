#include "token.hpp"
#include <algorithm>
#include <array>
#include <utility>

namespace quasar::cypher
{

  namespace
  {

    constexpr std::array<std::string_view, static_cast<size_t>(Token::With) + 1> kNames = {
        "ILLEGAL", "EOF", "WS", "COMMENT",
        "IDENT", "NUMBER", "INTEGER", "STRING", "BADSTRING", "BADESCAPE", "TRUE", "FALSE", "NULL",
        "+", "-", "*", "/", "%", "^", "=", "<>", "<", "<=", ">", ">=", "+=", "|",
        "AND", "OR", "XOR", "NOT",
        "(", ")", "{", "}", "[", "]", ",", ":", ";", ".", "..", "->", "<-", "[*",
        "ADD", "ALL", "AS", "ASC", "ASCENDING", "BY", "CASE", "CONSTRAINT", "CONTAINS", "CREATE",
        "DELETE", "DESC", "DESCENDING", "DETACH", "DISTINCT", "DO", "DROP", "ELSE", "END", "ENDS",
        "EXISTS", "FOR", "IN", "IS", "LIMIT", "MANDATORY", "MATCH", "MERGE", "OF", "ON",
        "OPTIONAL", "ORDER", "REMOVE", "REQUIRE", "RETURN", "SCALAR", "SET", "SKIP", "STARTS", "THEN",
        "UNION", "UNIQUE", "UNWIND", "WHEN", "WHERE", "WITH"};

    static_assert(kNames.back() == "WITH", "token name table out of step with Token");

    using KeywordEntry = std::pair<std::string_view, Token>;

    // sorted by word for binary search
    constexpr std::array<KeywordEntry, 53> kKeywords = {{
        {"add", Token::Add},
        {"all", Token::All},
        {"and", Token::And},
        {"as", Token::As},
        {"asc", Token::Asc},
        {"ascending", Token::Ascending},
        {"by", Token::By},
        {"case", Token::Case},
        {"constraint", Token::Constraint},
        {"contains", Token::Contains},
        {"create", Token::Create},
        {"delete", Token::Delete},
        {"desc", Token::Desc},
        {"descending", Token::Descending},
        {"detach", Token::Detach},
        {"distinct", Token::Distinct},
        {"do", Token::Do},
        {"drop", Token::Drop},
        {"else", Token::Else},
        {"end", Token::End},
        {"ends", Token::Ends},
        {"exists", Token::Exists},
        {"false", Token::False},
        {"for", Token::For},
        {"in", Token::In},
        {"is", Token::Is},
        {"limit", Token::Limit},
        {"mandatory", Token::Mandatory},
        {"match", Token::Match},
        {"merge", Token::Merge},
        {"not", Token::Not},
        {"null", Token::Null},
        {"of", Token::Of},
        {"on", Token::On},
        {"optional", Token::Optional},
        {"or", Token::Or},
        {"order", Token::Order},
        {"remove", Token::Remove},
        {"require", Token::Require},
        {"return", Token::Return},
        {"scalar", Token::Scalar},
        {"set", Token::Set},
        {"skip", Token::Skip},
        {"starts", Token::Starts},
        {"then", Token::Then},
        {"true", Token::True},
        {"union", Token::Union},
        {"unique", Token::Unique},
        {"unwind", Token::Unwind},
        {"when", Token::When},
        {"where", Token::Where},
        {"with", Token::With},
        {"xor", Token::Xor},
    }};

    static_assert(std::is_sorted(kKeywords.begin(), kKeywords.end(),
                                 [](const KeywordEntry &a, const KeywordEntry &b)
                                 { return a.first < b.first; }),
                  "keyword table must be sorted");

    constexpr size_t kLongestKeyword = 10;

  } // namespace

  std::string_view tokenName(Token tok)
  {
    auto i = static_cast<size_t>(tok);
    if (i < kNames.size())
      return kNames[i];
    return "";
  }

  bool isKeyword(Token tok)
  {
    return tok >= Token::Add && tok <= Token::With;
  }

  bool isOperator(Token tok)
  {
    return tok >= Token::Plus && tok <= Token::Not;
  }

  Token lookupKeyword(std::string_view word)
  {
    if (word.empty() || word.size() > kLongestKeyword)
      return Token::Ident;

    char buf[kLongestKeyword];
    for (size_t i = 0; i < word.size(); ++i)
    {
      char c = word[i];
      buf[i] = (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }
    std::string_view lower(buf, word.size());

    auto it = std::lower_bound(kKeywords.begin(), kKeywords.end(), lower,
                               [](const KeywordEntry &e, std::string_view w)
                               { return e.first < w; });
    if (it != kKeywords.end() && it->first == lower)
      return it->second;
    return Token::Ident;
  }

  std::string describe(const Lexeme &lx)
  {
    if (!lx.lit.empty())
      return lx.lit;
    return std::string(tokenName(lx.tok));
  }

} // namespace quasar::cypher
