#include <cassert>
#include <string>
#include <vector>

#include "core/tokenizer.hpp"

using guardsh::Tokenizer;

namespace {

using Tokens = std::vector<std::string>;

void test_whitespace_splitting() {
    Tokenizer tokenizer;

    assert(tokenizer.tokenize("").empty());
    assert(tokenizer.tokenize("   \t ").empty());
    assert((tokenizer.tokenize("ls -la  /tmp") == Tokens{"ls", "-la", "/tmp"}));
    assert((tokenizer.tokenize("  echo\thello  ") == Tokens{"echo", "hello"}));
}

void test_quotes_group_words() {
    Tokenizer tokenizer;

    assert((tokenizer.tokenize("echo 'hello   world'") == Tokens{"echo", "hello   world"}));
    assert((tokenizer.tokenize("echo \"a b\" c") == Tokens{"echo", "a b", "c"}));
    assert((tokenizer.tokenize("echo 'it'\"'\"'s'") == Tokens{"echo", "it's"}));
    assert((tokenizer.tokenize("grep \"\" file") == Tokens{"grep", "", "file"}));
    assert((tokenizer.tokenize("echo ''") == Tokens{"echo", ""}));
}

void test_backslash_escapes() {
    Tokenizer tokenizer;

    assert((tokenizer.tokenize("echo a\\ b") == Tokens{"echo", "a b"}));
    assert((tokenizer.tokenize("echo '\\n'") == Tokens{"echo", "\\n"}));
    assert((tokenizer.tokenize("echo \"\\n\\\"\"") == Tokens{"echo", "\\n\""}));
    assert((tokenizer.tokenize("echo trailing\\") == Tokens{"echo", "trailing\\"}));
}

void test_operators_are_plain_text() {
    Tokenizer tokenizer;

    assert((tokenizer.tokenize("cat a | grep b > out") == Tokens{"cat", "a", "|", "grep", "b", ">", "out"}));
    assert((tokenizer.tokenize("ls;rm -rf /") == Tokens{"ls;rm", "-rf", "/"}));
    assert((tokenizer.tokenize("echo $(whoami) `id`") == Tokens{"echo", "$(whoami)", "`id`"}));
}

} // namespace

int main() {
    test_whitespace_splitting();
    test_quotes_group_words();
    test_backslash_escapes();
    test_operators_are_plain_text();
    return 0;
}
