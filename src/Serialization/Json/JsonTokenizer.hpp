// @file JsonTokenizer.hpp
// @brief JSON5トークナイザーの定義。入力文字列からトークン列を生成する。

#pragma once

#include <cerrno>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "Serialization/MessageOutput.hpp"
#include "Serialization/TokenManager.hpp"

// 識別子文字の列挙（ヘッダ末尾でundefする）
#define KIRIKAE_CASE_ALPHA_LOWER \
    case 'a': case 'b': case 'c': case 'd': case 'e': case 'f': case 'g': case 'h': case 'i': \
    case 'j': case 'k': case 'l': case 'm': case 'n': case 'o': case 'p': case 'q': case 'r': \
    case 's': case 't': case 'u': case 'v': case 'w': case 'x': case 'y': case 'z'

#define KIRIKAE_CASE_ALPHA_UPPER \
    case 'A': case 'B': case 'C': case 'D': case 'E': case 'F': case 'G': case 'H': case 'I': \
    case 'J': case 'K': case 'L': case 'M': case 'N': case 'O': case 'P': case 'Q': case 'R': \
    case 'S': case 'T': case 'U': case 'V': case 'W': case 'X': case 'Y': case 'Z'

#define KIRIKAE_CASE_DIGITS19 \
    case '1': case '2': case '3': case '4': case '5': \
    case '6': case '7': case '8': case '9'
#define KIRIKAE_CASE_DIGITS case '0': KIRIKAE_CASE_DIGITS19

namespace kirikae::serialization {

// 入力文字列取得元のconcept
template <typename T>
concept InputSource = requires(T& t, const T& ct, std::size_t offset, std::size_t count) {
    { ct.peekAhead(offset) } -> std::same_as<char>;
    { t.consume(count) } -> std::same_as<void>;
    { ct.position() } -> std::same_as<std::size_t>;
};

// @brief トークン管理型が満たすべきインターフェース
template <typename T>
concept IsTokenManager = requires(T& t, JsonToken&& token) {
    { t.pushToken(std::move(token)) } -> std::same_as<void>;
};

// ******************************************************************************** JsonTokenizer
// @brief JSON5トークナイザー（入力文字列からトークン列を生成）
// @note ':' と ',' はトークン化しない。区切りの位置は読み進めながら検査し、キー位置の文字列・識別子をキーとして扱う。
template <InputSource Input, IsTokenManager TokMgr>
class JsonTokenizer {
    // ******************************************************************************** 空白文字とコメントのスキップ
private:
    // @brief 空白文字とコメントをスキップ
    void skipWhitespaceAndComments() {
        for (;;) {
            switch (static_cast<unsigned char>(peek())) {
            case ' ':
            case '\t':
            case '\n':
            case '\r':
            case '\v':
            case '\f':
                consume();
                continue;
            case 0xC2:  // U+00A0 (Non-breaking space)
                if (matchUtf8Bytes(1, 0xA0)) {
                    consume(2);
                    continue;
                }
                return;
            case 0xE2:  // U+2028 / U+2029
                if (matchUtf8Bytes(1, 0x80)
                    && (static_cast<unsigned char>(peekAhead(2)) == 0xA8
                        || static_cast<unsigned char>(peekAhead(2)) == 0xA9)) {
                    consume(3);
                    continue;
                }
                return;
            case 0xE3:  // U+3000 (Ideographic space)
                if (matchUtf8Bytes(1, 0x80) && static_cast<unsigned char>(peekAhead(2)) == 0x80) {
                    consume(3);
                    continue;
                }
                return;
            case 0xEF:  // U+FEFF (Byte order mark)
                if (matchUtf8Bytes(1, 0xBB) && static_cast<unsigned char>(peekAhead(2)) == 0xBF) {
                    consume(3);
                    continue;
                }
                return;
            case '/':
                switch (peekAhead(1)) {
                case '/':
                    consume(2);
                    while (!isLineTerminator()) {
                        consume();
                    }
                    continue;
                case '*':
                    consume(2);
                    for (;;) {
                        const char ch = peek();
                        if (ch == '\0') {
                            throw std::runtime_error("JSON5: unterminated block comment");
                        }
                        if (ch == '*' && peekAhead(1) == '/') {
                            consume(2);
                            break;
                        }
                        consume();
                    }
                    continue;
                default:
                    return;
                }
            default:
                return;
            }
        }
    }

    // ******************************************************************************** 文字列・識別子の解析
private:
    // @brief 文字列をパース
    // @param quote 開始引用符（'または"）
    std::string parseString(char quote) {
        std::string result;
        consume();

        for (;;) {
            const unsigned char c = static_cast<unsigned char>(peek());
            switch (c) {
            case '\0':
                throw std::runtime_error("JSON5: unterminated string");
            case '\n':
            case '\r':
                throw std::runtime_error("JSON5: line break in string");
            case '"':
            case '\'':
                consume();
                if (static_cast<char>(c) == quote) {
                    return result;
                }
                result += static_cast<char>(c);
                break;
            case '\\':
                consume();
                parseEscape(result);
                break;
            case 0xE2:
                if (matchUtf8Bytes(1, 0x80)) {
                    const unsigned char third = static_cast<unsigned char>(peekAhead(2));
                    if (third == 0xA8 || third == 0xA9) {
                        warningOutput_->warning(std::string("Unescaped ")
                            + (third == 0xA8 ? "U+2028" : "U+2029")
                            + " in string at position " + std::to_string(inputSource_.position()));
                    }
                }
                consumeUnicodeChar(result);
                break;
            default:
                if (!consumeUnicodeChar(result)) {
                    result += static_cast<char>(c);
                    consume();
                }
                break;
            }
        }
    }

    // @brief '\' に続くエスケープシーケンスを1つ処理する
    void parseEscape(std::string& result) {
        const char next = peek();
        consume();
        switch (next) {
        case '"':  result += '"'; break;
        case '\'': result += '\''; break;
        case '\\': result += '\\'; break;
        case '/':  result += '/'; break;
        case 'b':  result += '\b'; break;
        case 'f':  result += '\f'; break;
        case 'n':  result += '\n'; break;
        case 'r':  result += '\r'; break;
        case 't':  result += '\t'; break;
        case 'v':  result += '\v'; break;
        case '0':
            if (isDecimalDigit(peek())) {
                throw std::runtime_error("JSON5: decimal digit must not follow \\0 escape sequence");
            }
            result += '\0';
            break;
        case '\n':
            break;
        case '\r':
            if (peek() == '\n') {
                consume();
            }
            break;
        case 'x':
            appendUtf8(result, parseHexEscape(2, "\\x"));
            break;
        case 'u':
            appendUtf8(result, parseUnicodeEscape());
            break;
        case '\0':
            throw std::runtime_error("JSON5: unterminated string");
        default:
            if (isDecimalDigit(next)) {
                throw std::runtime_error("JSON5: invalid escape sequence '\\" + std::string(1, next) + "'");
            }
            result += next;
            break;
        }
    }

    // @brief \u の後の4桁を読み、サロゲートペアなら後続の \uXXXX と結合する
    int parseUnicodeEscape() {
        const int unit = parseHexEscape(4, "\\u");
        if (unit < 0xD800 || unit > 0xDBFF) {
            return unit;
        }
        if (peek() != '\\' || peekAhead(1) != 'u') {
            throw std::runtime_error("JSON5: unpaired high surrogate in \\u escape");
        }
        consume(2);
        const int low = parseHexEscape(4, "\\u");
        if (low < 0xDC00 || low > 0xDFFF) {
            throw std::runtime_error("JSON5: invalid low surrogate in \\u escape");
        }
        return 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
    }

    // @brief 識別子をパース（JSON5のキー名用）
    std::string parseIdentifier() {
        std::string result;
        switch (peek()) {
        case '$': case '_':
        KIRIKAE_CASE_ALPHA_LOWER:
        KIRIKAE_CASE_ALPHA_UPPER:
            result += peek();
            consume();
            break;
        case '\\':
            consume();
            appendIdentifierEscape(result);
            break;
        default:
            if (!consumeUnicodeChar(result)) {
                throw std::runtime_error(
                    std::string("JSON5: unexpected character '") + peek() + "'");
            }
            break;
        }

        for (;;) {
            switch (peek()) {
            case '$': case '_':
            KIRIKAE_CASE_DIGITS:
            KIRIKAE_CASE_ALPHA_LOWER:
            KIRIKAE_CASE_ALPHA_UPPER:
                result += peek();
                consume();
                break;
            case '\\':
                consume();
                appendIdentifierEscape(result);
                break;
            default:
                if (!consumeUnicodeChar(result)) {
                    return result;
                }
                break;
            }
        }
    }

    // 識別子内では \uXXXX のみ許可する
    void appendIdentifierEscape(std::string& result) {
        if (peek() != 'u') {
            throw std::runtime_error("JSON5: invalid escape in identifier");
        }
        consume();
        appendUtf8(result, parseUnicodeEscape());
    }

    // @brief 16進数エスケープシーケンスをパース（\xXX または \uXXXX）
    int parseHexEscape(int numDigits, const char* escapeName) {
        int codePoint = 0;
        for (int i = 0; i < numDigits; ++i) {
            const char hexChar = peek();
            const int digitValue = hexDigitToValue(hexChar);
            if (digitValue == -1) {
                throw std::runtime_error(
                    std::string("JSON5: invalid escape sequence '") + escapeName
                    + "', expected hex digit but got '" + hexChar + "'");
            }
            consume();
            codePoint = (codePoint << 4) | digitValue;
        }
        return codePoint;
    }

    // @brief Unicode コードポイントをUTF-8にエンコードして文字列に追加
    static void appendUtf8(std::string& result, int codePoint) {
        if (codePoint < 0) {
            throw std::runtime_error("JSON5: invalid code point");
        } else if (codePoint <= 0x7F) {
            result += static_cast<char>(codePoint);
        } else if (codePoint <= 0x7FF) {
            result += static_cast<char>(0xC0 | ((codePoint >> 6) & 0x1F));
            result += static_cast<char>(0x80 | (codePoint & 0x3F));
        } else if (codePoint <= 0xFFFF) {
            result += static_cast<char>(0xE0 | ((codePoint >> 12) & 0x0F));
            result += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
            result += static_cast<char>(0x80 | (codePoint & 0x3F));
        } else if (codePoint <= 0x10FFFF) {
            result += static_cast<char>(0xF0 | ((codePoint >> 18) & 0x07));
            result += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
            result += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
            result += static_cast<char>(0x80 | (codePoint & 0x3F));
        } else {
            throw std::runtime_error("JSON5: code point out of Unicode range");
        }
    }

    // @brief マルチバイトUTF-8文字を1文字消費して追加
    // @return ASCII文字ならfalse（消費しない）
    // @throws std::runtime_error 不正な、または途中で切れたUTF-8列
    bool consumeUnicodeChar(std::string& result) {
        const unsigned char first = static_cast<unsigned char>(peek());
        std::size_t length = 0;
        if (first < 0x80) {
            return false;
        } else if (first >= 0xC2 && first <= 0xDF) {
            length = 2;
        } else if ((first & 0xF0) == 0xE0) {
            length = 3;
        } else if (first >= 0xF0 && first <= 0xF4) {
            length = 4;
        } else {
            throw std::runtime_error("JSON5: invalid UTF-8 sequence");
        }
        // 後続バイトは 10xxxxxx。終端の '\0' もここで弾かれる。
        for (std::size_t i = 1; i < length; ++i) {
            if ((static_cast<unsigned char>(peekAhead(i)) & 0xC0) != 0x80) {
                throw std::runtime_error("JSON5: invalid UTF-8 sequence");
            }
        }
        for (std::size_t i = 0; i < length; ++i) {
            result += peekAhead(i);
        }
        consume(length);
        return true;
    }

    // ******************************************************************************** 数値の解析
private:
    // @brief 数値をパース（符号、16進数、10進数、±Infinity、±NaN）
    void parseNumber(char c, std::size_t tokenPos) {
        bool isNegative = false;
        if (c == '+' || c == '-') {
            isNegative = (c == '-');
            consume();
            c = peek();
            if (c == 'I' || c == 'N') {
                parseSignedReservedNumber(c, isNegative, tokenPos);
                return;
            }
        }

        const char nextChar = peekAhead(1);
        if (c == '0' && (nextChar == 'x' || nextChar == 'X')) {
            consume(2);
            std::uint64_t value = 0;
            bool hasDigits = false;
            for (int digitValue = hexDigitToValue(peek()); digitValue != -1;
                 digitValue = hexDigitToValue(peek())) {
                consume();
                hasDigits = true;
                if (value > (std::numeric_limits<std::uint64_t>::max() >> 4)) {
                    throw std::runtime_error("JSON5: hexadecimal number out of range");
                }
                value = (value << 4) | static_cast<std::uint64_t>(digitValue);
            }
            if (!hasDigits) {
                throw std::runtime_error("JSON5: invalid hexadecimal number");
            }
            const auto limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
            if (value > limit + (isNegative ? 1 : 0)) {
                throw std::runtime_error("JSON5: hexadecimal number out of range");
            }
            const std::int64_t signedValue = isNegative
                ? static_cast<std::int64_t>(0 - value)
                : static_cast<std::int64_t>(value);
            emitToken(json_token_detail::IntVal{signedValue}, tokenPos);
            return;
        }

        parseDecimalNumber(isNegative, tokenPos);
    }

    // @brief 符号付きの Infinity / NaN
    void parseSignedReservedNumber(char c, bool isNegative, std::size_t tokenPos) {
        double value = 0.0;
        if (c == 'I' && matchReservedWord("Infinity")) {
            value = std::numeric_limits<double>::infinity();
        } else if (c == 'N' && matchReservedWord("NaN")) {
            value = std::numeric_limits<double>::quiet_NaN();
        } else {
            throw std::runtime_error("JSON5: invalid number format");
        }
        emitToken(json_token_detail::NumVal{isNegative ? -value : value}, tokenPos);
    }

    static constexpr int hexDigitToValue(char c) {
        switch (c) {
        case '0': return 0;
        case '1': return 1;
        case '2': return 2;
        case '3': return 3;
        case '4': return 4;
        case '5': return 5;
        case '6': return 6;
        case '7': return 7;
        case '8': return 8;
        case '9': return 9;
        case 'a': case 'A': return 10;
        case 'b': case 'B': return 11;
        case 'c': case 'C': return 12;
        case 'd': case 'D': return 13;
        case 'e': case 'E': return 14;
        case 'f': case 'F': return 15;
        default: return -1;
        }
    }

    static constexpr bool isDecimalDigit(char c) {
        switch (c) {
        KIRIKAE_CASE_DIGITS:
            return true;
        default:
            return false;
        }
    }

    // @brief 10進数をパース（整数部・小数部・指数部）
    // @note 字句を切り出してから標準ライブラリで変換する。整数が64bitに収まらない場合は浮動小数点数として扱う。
    void parseDecimalNumber(bool isNegative, std::size_t tokenPos) {
        std::string text;
        if (isNegative) {
            text += '-';
        }
        bool hasIntegerDigits = false;
        bool hasFractionalDigits = false;
        bool isFloating = false;

        while (isDecimalDigit(peek())) {
            hasIntegerDigits = true;
            text += peek();
            consume();
        }
        if (peek() == '.') {
            isFloating = true;
            text += '.';
            consume();
            while (isDecimalDigit(peek())) {
                hasFractionalDigits = true;
                text += peek();
                consume();
            }
        }
        if (!hasIntegerDigits && !hasFractionalDigits) {
            throw std::runtime_error("JSON5: invalid number format");
        }
        if (peek() == 'e' || peek() == 'E') {
            isFloating = true;
            text += 'e';
            consume();
            if (peek() == '+' || peek() == '-') {
                text += peek();
                consume();
            }
            bool hasExpDigits = false;
            while (isDecimalDigit(peek())) {
                hasExpDigits = true;
                text += peek();
                consume();
            }
            if (!hasExpDigits) {
                throw std::runtime_error("JSON5: invalid exponent");
            }
        }

        if (!isFloating) {
            std::int64_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec == std::errc{} && ptr == text.data() + text.size()) {
                emitToken(json_token_detail::IntVal{value}, tokenPos);
                return;
            }
        }
        emitToken(json_token_detail::NumVal{std::strtod(text.c_str(), nullptr)}, tokenPos);
    }

    // ******************************************************************************** 入力文字取得・判定
private:
    char peek() const { return inputSource_.peekAhead(0); }

    char peekAhead(std::size_t offset) const { return inputSource_.peekAhead(offset); }

    void consume(std::size_t count = 1) { inputSource_.consume(count); }

    bool matchUtf8Bytes(std::size_t offset, unsigned char expected) const {
        return static_cast<unsigned char>(peekAhead(offset)) == expected;
    }

    // @brief 現在位置が改行か終端か（U+000A, U+000D, U+2028, U+2029, '\0'）
    bool isLineTerminator() const {
        switch (static_cast<unsigned char>(peek())) {
        case '\n':
        case '\r':
        case '\0':
            return true;
        case 0xE2:
            return matchUtf8Bytes(1, 0x80)
                && (static_cast<unsigned char>(peekAhead(2)) == 0xA8
                    || static_cast<unsigned char>(peekAhead(2)) == 0xA9);
        default:
            return false;
        }
    }

    // ******************************************************************************** トークン生成
private:
    // 次に受け付ける字句
    enum class Expect {
        Value,       ///< 値（先頭、':' の後）
        ValueOrEnd,  ///< 値または ']'（'[' の後、配列内の ',' の後）
        KeyOrEnd,    ///< キーまたは '}'（'{' の後、オブジェクト内の ',' の後）
        Colon,       ///< キーの後の ':'
        Separator,   ///< コンテナ内の値の後の ',' または閉じ括弧
        Done,        ///< 最上位の値の後（末尾のみ）
    };

    void generateAllTokens() {
        while (generateNextToken())
            ;
        emitToken(json_token_detail::EndOfStreamTag{}, inputSource_.position());
    }

    // @brief 次のトークンを1つ生成してtokenManager_に追加
    // @return まだ続きがあるならtrue、終端ならfalse。
    bool generateNextToken() {
        skipWhitespaceAndComments();
        const std::size_t tokenPos = inputSource_.position();
        const char c = peek();

        switch (c) {
        case '\0':
            if (expect_ != Expect::Done) {
                throw std::runtime_error("JSON5: unexpected end of input");
            }
            return false;
        case '{':
            beginValue(c);
            consume();
            emitToken(json_token_detail::StartObjectTag{}, tokenPos);
            containers_.push_back(true);
            expect_ = Expect::KeyOrEnd;
            break;
        case '[':
            beginValue(c);
            consume();
            emitToken(json_token_detail::StartArrayTag{}, tokenPos);
            containers_.push_back(false);
            expect_ = Expect::ValueOrEnd;
            break;
        case '}':
            closeContainer(c, true);
            emitToken(json_token_detail::EndObjectTag{}, tokenPos);
            break;
        case ']':
            closeContainer(c, false);
            emitToken(json_token_detail::EndArrayTag{}, tokenPos);
            break;
        case ':':
            if (expect_ != Expect::Colon) {
                unexpected(c);
            }
            consume();
            expect_ = Expect::Value;
            break;
        case ',':
            if (expect_ != Expect::Separator) {
                unexpected(c);
            }
            consume();
            expect_ = containers_.back() ? Expect::KeyOrEnd : Expect::ValueOrEnd;
            break;
        case '"':
        case '\'':
            if (expect_ == Expect::KeyOrEnd) {
                emitKey(parseString(c), tokenPos);
            } else {
                beginValue(c);
                emitToken(json_token_detail::StrVal{parseString(c)}, tokenPos);
                endValue();
            }
            break;
        case '+': case '-': case '.':
        KIRIKAE_CASE_DIGITS:
            beginValue(c);
            parseNumber(c, tokenPos);
            endValue();
            break;
        default:
            if (expect_ == Expect::KeyOrEnd) {
                emitKey(parseIdentifier(), tokenPos);
            } else {
                beginValue(c);
                parseWordValue(tokenPos);
                endValue();
            }
            break;
        }
        return true;
    }

    // @brief 値を置ける位置でなければ例外
    void beginValue(char c) const {
        if (expect_ != Expect::Value && expect_ != Expect::ValueOrEnd) {
            unexpected(c);
        }
    }

    // @brief 値の後はコンテナ内なら区切り、最上位なら末尾を待つ
    void endValue() {
        expect_ = containers_.empty() ? Expect::Done : Expect::Separator;
    }

    // @brief 閉じ括弧の対応と位置を確かめて消費する
    void closeContainer(char c, bool isObject) {
        const Expect afterOpen = isObject ? Expect::KeyOrEnd : Expect::ValueOrEnd;
        if (containers_.empty() || containers_.back() != isObject
            || (expect_ != afterOpen && expect_ != Expect::Separator)) {
            unexpected(c);
        }
        consume();
        containers_.pop_back();
        endValue();
    }

    void emitKey(std::string text, std::size_t tokenPos) {
        emitToken(json_token_detail::KeyVal{std::move(text)}, tokenPos);
        expect_ = Expect::Colon;
    }

    // @brief 値の位置に現れた識別子。予約語以外は受け付けない。
    void parseWordValue(std::size_t tokenPos) {
        if (matchReservedWord("null")) {
            emitToken(json_token_detail::NullTag{}, tokenPos);
        } else if (matchReservedWord("true")) {
            emitToken(json_token_detail::BoolVal{true}, tokenPos);
        } else if (matchReservedWord("false")) {
            emitToken(json_token_detail::BoolVal{false}, tokenPos);
        } else if (matchReservedWord("Infinity")) {
            emitToken(json_token_detail::NumVal{std::numeric_limits<double>::infinity()}, tokenPos);
        } else if (matchReservedWord("NaN")) {
            emitToken(json_token_detail::NumVal{std::numeric_limits<double>::quiet_NaN()}, tokenPos);
        } else {
            throw std::runtime_error("JSON5: unquoted string '" + parseIdentifier() + "' is not a value");
        }
    }

    [[noreturn]] void unexpected(char c) const {
        const std::string found = c == '\0' ? std::string("end of input") : std::string("'") + c + "'";
        switch (expect_) {
        case Expect::KeyOrEnd:
            throw std::runtime_error("JSON5: expected key but got " + found);
        case Expect::Colon:
            throw std::runtime_error("JSON5: expected ':' but got " + found);
        case Expect::Separator:
        case Expect::Done:
            throw std::runtime_error("JSON5: unexpected " + found + " after value");
        default:
            throw std::runtime_error("JSON5: expected value but got " + found);
        }
    }

    template <std::size_t N>
    bool matchesWordAt(const char (&word)[N]) const {
        for (std::size_t i = 0; i + 1 < N; ++i) {
            if (peekAhead(i) != word[i]) {
                return false;
            }
        }
        return true;
    }

    // @brief 予約語と一致すれば消費してtrue
    template <std::size_t N>
    bool matchReservedWord(const char (&word)[N]) {
        if (matchesWordAt(word) && !isIdentifierPart(peekAhead(N - 1))) {
            consume(N - 1);
            return true;
        }
        return false;
    }

    static constexpr bool isIdentifierPart(char c) {
        switch (c) {
        case '$': case '_': case '\\':
        KIRIKAE_CASE_DIGITS:
        KIRIKAE_CASE_ALPHA_LOWER:
        KIRIKAE_CASE_ALPHA_UPPER:
            return true;
        default:
            return static_cast<unsigned char>(c) >= 0x80;
        }
    }

    template <typename TokenT>
    void emitToken(TokenT&& tokenValue, std::size_t position) {
        tokenManager_.pushToken(JsonToken{JsonTokenValue{std::forward<TokenT>(tokenValue)}, position});
    }

    static MessageOutput& defaultWarningOutput() {
        static StdoutMessageOutput output;
        return output;
    }

    // ******************************************************************************** 構築
public:
    // @brief コンストラクタ（警告は標準出力へ）
    JsonTokenizer(Input& inputSource, TokMgr& tokenManager)
        : inputSource_(inputSource), tokenManager_(tokenManager), warningOutput_(&defaultWarningOutput()) {}

    // @brief コンストラクタ（警告出力先を指定）
    JsonTokenizer(Input& inputSource, TokMgr& tokenManager, MessageOutput& warnOut)
        : inputSource_(inputSource), tokenManager_(tokenManager), warningOutput_(&warnOut) {}

    // @brief 入力全体をトークン化する
    void tokenize() {
        try {
            generateAllTokens();
        } catch (const std::exception& e) {
            throw std::runtime_error(std::string("JSON5 parse error at position ")
                + std::to_string(inputSource_.position()) + ": " + e.what());
        }
    }

    // ******************************************************************************** メンバー変数
private:
    Input& inputSource_;             ///< 入力文字列取得元の参照
    TokMgr& tokenManager_;           ///< トークン管理オブジェクトの参照
    MessageOutput* warningOutput_;   ///< 警告メッセージ出力先
    std::vector<bool> containers_;   ///< 開いているコンテナ（trueはオブジェクト）
    Expect expect_ = Expect::Value;  ///< 次に受け付ける字句
};

}  // namespace kirikae::serialization

#undef KIRIKAE_CASE_ALPHA_LOWER
#undef KIRIKAE_CASE_ALPHA_UPPER
#undef KIRIKAE_CASE_DIGITS19
#undef KIRIKAE_CASE_DIGITS
