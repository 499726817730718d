/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <justifier.hpp>
#include <utils.hpp>

#include <cstdio>
#include <cstdlib>
#include <random>
#include <sstream>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

typedef std::vector<std::string> Words;

Words lines_of(const JustifyResult &r) {
    CHECK(std::holds_alternative<Words>(r));
    return std::get<Words>(r);
}

Partition partition_of(const PartitionResult &r) {
    CHECK(std::holds_alternative<Partition>(r));
    return std::get<Partition>(r);
}

// Every word exactly once, in order, no empty lines, width respected
// except for a lone oversized word.
void check_layout(const Words &words, int64_t width, const Words &lines) {
    Words seen;
    for(const auto &line : lines) {
        CHECK(!line.empty());
        const auto line_words = split_to_words(line);
        CHECK(!line_words.empty());
        if(line_words.size() > 1) {
            CHECK(int64_t(utf8_length(line)) <= width);
        }
        seen.insert(seen.end(), line_words.begin(), line_words.end());
    }
    CHECK(seen == words);
}

struct BruteForceResult {
    int64_t best_badness;
    std::vector<size_t> best_breaks;
};

// Tries every way of cutting the words into lines. Among the cheapest
// layouts picks the one whose line ends are lexicographically greatest.
BruteForceResult brute_force(const Words &words, int64_t width) {
    const size_t n = words.size();
    CHECK(n > 0 && n <= 12);
    BruteForceResult best{-1, {}};
    for(uint32_t mask = 0; mask < (uint32_t(1) << (n - 1)); ++mask) {
        std::vector<size_t> breaks;
        for(size_t i = 0; i + 1 < n; ++i) {
            if(mask & (uint32_t(1) << i)) {
                breaks.push_back(i + 1);
            }
        }
        breaks.push_back(n);
        int64_t total = 0;
        bool feasible = true;
        size_t begin = 0;
        for(const auto end : breaks) {
            int64_t length = int64_t(end - begin - 1);
            for(size_t i = begin; i < end; ++i) {
                length += int64_t(utf8_length(words[i]));
            }
            if(end - begin == 1 && length > width) {
                // Forced overflow.
            } else if(length > width) {
                feasible = false;
                break;
            } else if(end != n) {
                total += (width - length) * (width - length);
            }
            begin = end;
        }
        if(!feasible) {
            continue;
        }
        if(best.best_badness < 0 || total < best.best_badness ||
           (total == best.best_badness && breaks > best.best_breaks)) {
            best.best_badness = total;
            best.best_breaks = breaks;
        }
    }
    return best;
}

std::vector<size_t> breaks_of(const Partition &p) {
    std::vector<size_t> breaks;
    for(const auto &span : p.lines) {
        breaks.push_back(span.end);
    }
    return breaks;
}

} // namespace

void test_empty_input() {
    const auto lines = lines_of(justify_text({}, 10));
    CHECK(lines.empty());
    Justifier j({}, 10);
    const auto p = partition_of(j.optimal_partition());
    CHECK(p.lines.empty());
    CHECK(p.total_badness == 0);
}

void test_single_letter() {
    const auto lines = lines_of(justify_text({"a"}, 1));
    CHECK(lines == Words{"a"});
}

void test_exact_fit() {
    const auto lines = lines_of(justify_text({"ab", "cd"}, 5));
    CHECK(lines == Words{"ab cd"});
    Justifier j({"ab", "cd"}, 5);
    const auto p = partition_of(j.optimal_partition());
    CHECK(p.total_badness == 0);
}

void test_reference_paragraph() {
    const Words words{"aaaa", "bb", "cc", "dddd", "e", "fff", "gg", "h"};
    const int64_t width = 6;
    Justifier j(words, width);
    const auto p = partition_of(j.optimal_partition());
    const auto brute = brute_force(words, width);
    CHECK(p.total_badness == brute.best_badness);
    CHECK(breaks_of(p) == brute.best_breaks);

    const auto lines = j.build_lines(p);
    const Words expected{"aaaa", "bb cc", "dddd e", "fff gg", "h"};
    CHECK(lines == expected);
    CHECK(p.total_badness == 5);
    const std::vector<LineSpan> expected_spans{
        {0, 1, 4}, {1, 3, 1}, {3, 5, 0}, {5, 7, 0}, {7, 8, 0}};
    CHECK(p.lines == expected_spans);
}

void test_oversized_word() {
    const std::string long_word(20, 'x');
    const auto lines = lines_of(justify_text({long_word}, 5));
    CHECK(lines.size() == 1);
    CHECK(lines.front() == long_word);
    CHECK(lines.front().length() == 20);
}

void test_oversized_word_in_middle() {
    const Words words{"ab", "c", "abcdefghij", "de", "f"};
    const auto lines = lines_of(justify_text(words, 4));
    check_layout(words, 4, lines);
    const Words expected{"ab c", "abcdefghij", "de f"};
    CHECK(lines == expected);

    Justifier j(words, 4);
    const auto p = partition_of(j.optimal_partition());
    CHECK(p.lines[1].badness == 0);
    CHECK(p.total_badness == brute_force(words, 4).best_badness);
}

void test_invalid_width() {
    for(const int64_t width : {int64_t(0), int64_t(-1), int64_t(-100)}) {
        const auto r = justify_text({"a", "b"}, width);
        CHECK(std::holds_alternative<JustifyError>(r));
        CHECK(std::get<JustifyError>(r) == JustifyError::InvalidWidth);
        const auto g = justify_text({"a", "b"}, width, BreakStrategy::Greedy);
        CHECK(std::holds_alternative<JustifyError>(g));
    }
    // Reported even when there is nothing to lay out.
    CHECK(std::holds_alternative<JustifyError>(justify_text({}, 0)));
}

void test_huge_width() {
    const Words words{"a", std::string(10, 'b'), "c"};
    for(const int64_t width : {int64_t(4000000000), max_line_width + 1}) {
        const auto r = justify_text(words, width);
        CHECK(std::holds_alternative<JustifyError>(r));
        CHECK(std::get<JustifyError>(r) == JustifyError::WidthTooLarge);
        Justifier j(words, width);
        CHECK(std::holds_alternative<JustifyError>(j.greedy_partition()));
        CHECK(!j.line_badness(0, 1));
    }

    CHECK(lines_of(justify_text(words, max_line_width)) == Words{"a bbbbbbbbbb c"});

    // Nearly the whole width left empty on a line that is not the last.
    const std::string full_line(size_t(max_line_width), 'b');
    Justifier j({"a", full_line, "c"}, max_line_width);
    const auto p = partition_of(j.optimal_partition());
    CHECK(p.lines.size() == 3);
    CHECK(p.total_badness == (max_line_width - 1) * (max_line_width - 1));
    CHECK(p.lines[0].badness == p.total_badness);
}

void test_malformed_words() {
    const auto truncated = justify_text({"ok", "\xc3"}, 5);
    CHECK(std::holds_alternative<JustifyError>(truncated));
    CHECK(std::get<JustifyError>(truncated) == JustifyError::MalformedWord);

    const auto empty = justify_text({"a", ""}, 5);
    CHECK(std::holds_alternative<JustifyError>(empty));
    CHECK(std::get<JustifyError>(empty) == JustifyError::MalformedWord);

    Justifier j({"\xc3"}, 5);
    CHECK(std::holds_alternative<JustifyError>(j.greedy_partition()));
    const std::string message = error_text(JustifyError::MalformedWord);
    CHECK(message != error_text(JustifyError::InvalidWidth));
}

void test_last_line_is_free() {
    Justifier j({"aaaaaaaa", "b"}, 8);
    const auto p = partition_of(j.optimal_partition());
    CHECK(j.build_lines(p) == (Words{"aaaaaaaa", "b"}));
    CHECK(p.total_badness == 0);
    CHECK(p.lines.back().badness == 0);

    // A lone line is also the last one.
    Justifier single({"a", "b"}, 40);
    CHECK(partition_of(single.optimal_partition()).total_badness == 0);
}

void test_tie_prefers_longer_first_line() {
    // "xxx | w ccc | ddddd" and "xxx w | ccc | ddddd" both cost 4.
    const Words words{"xxx", "w", "ccc", "ddddd"};
    Justifier j(words, 5);
    const auto p = partition_of(j.optimal_partition());
    CHECK(p.total_badness == 4);
    CHECK(j.build_lines(p) == (Words{"xxx w", "ccc", "ddddd"}));
}

void test_line_badness() {
    Justifier j({"aa", "bb", "cccccccc", "d"}, 6);
    CHECK(j.raw_length(0, 2) == 5);
    CHECK(*j.line_badness(0, 1) == 16);
    CHECK(*j.line_badness(0, 2) == 1);
    CHECK(!j.line_badness(0, 3));
    CHECK(*j.line_badness(2, 3) == 0);
    CHECK(!j.line_badness(2, 4));
    CHECK(*j.line_badness(3, 4) == 0);
}

void test_greedy() {
    const Words words{"aaa", "bb", "cc", "ddddd"};
    Justifier j(words, 6);
    const auto greedy = partition_of(j.greedy_partition());
    CHECK(j.build_lines(greedy) == (Words{"aaa bb", "cc", "ddddd"}));
    CHECK(greedy.total_badness == 16);
    const auto optimal = partition_of(j.optimal_partition());
    CHECK(j.build_lines(optimal) == (Words{"aaa", "bb cc", "ddddd"}));
    CHECK(optimal.total_badness == 10);
}

void test_padding() {
    Justifier j({"a", "bb", "c", "ddddddd"}, 9);
    const auto p = partition_of(j.optimal_partition());
    const auto padded = j.build_padded_lines(p);
    CHECK(padded == (Words{"a   bb  c", "ddddddd"}));

    Justifier single({"abc", "defghij"}, 7);
    const auto sp = partition_of(single.optimal_partition());
    CHECK(single.build_padded_lines(sp) == (Words{"abc    ", "defghij"}));

    const std::string long_word(9, 'z');
    Justifier overflow({long_word, "a"}, 4);
    const auto op = partition_of(overflow.optimal_partition());
    CHECK(overflow.build_padded_lines(op) == (Words{long_word, "a"}));
}

void test_utf8_widths() {
    CHECK(utf8_length("päämaja") == 7);
    CHECK(utf8_length("us—more") == 7);
    // Four characters each, would not fit if measured in bytes.
    const auto lines = lines_of(justify_text({"ääää", "öööö"}, 9));
    CHECK(lines == Words{"ääää öööö"});
}

void test_split_to_words() {
    CHECK(split_to_words("").empty());
    CHECK(split_to_words(" \t\n ").empty());
    CHECK(split_to_words("  foo\tbar\r\n\nbaz  ") == (Words{"foo", "bar", "baz"}));
    CHECK(split_to_words("one") == Words{"one"});
}

void test_read_words() {
    std::istringstream good("Hello!  Nice\n\n to meet\tyou.\n");
    auto r = read_words(good);
    CHECK(std::holds_alternative<Words>(r));
    CHECK(std::get<Words>(r) == (Words{"Hello!", "Nice", "to", "meet", "you."}));

    std::istringstream bad("fine line\nbroken \xff byte\nmore\n");
    auto b = read_words(bad);
    CHECK(std::holds_alternative<InvalidUtf8>(b));
    CHECK(std::get<InvalidUtf8>(b).line_number == 2);
}

void test_random_against_brute_force() {
    std::mt19937 gen(1234);
    std::uniform_int_distribution<int> num_words_dist(1, 8);
    std::uniform_int_distribution<int> word_len_dist(1, 7);
    std::uniform_int_distribution<int> width_dist(1, 14);
    for(int round = 0; round < 2000; ++round) {
        Words words;
        const int n = num_words_dist(gen);
        for(int i = 0; i < n; ++i) {
            words.emplace_back(size_t(word_len_dist(gen)), char('a' + i));
        }
        const int64_t width = width_dist(gen);

        Justifier j(words, width);
        const auto p = partition_of(j.optimal_partition());
        const auto lines = j.build_lines(p);
        check_layout(words, width, lines);

        const auto brute = brute_force(words, width);
        CHECK(p.total_badness == brute.best_badness);
        CHECK(breaks_of(p) == brute.best_breaks);

        int64_t sum = 0;
        for(const auto &span : p.lines) {
            sum += span.badness;
        }
        CHECK(sum == p.total_badness);
        CHECK(p.lines.back().badness == 0);

        const auto greedy = partition_of(j.greedy_partition());
        check_layout(words, width, j.build_lines(greedy));
        CHECK(greedy.total_badness >= p.total_badness);

        const auto padded = j.build_padded_lines(p);
        CHECK(padded.size() == lines.size());
        for(size_t i = 0; i + 1 < padded.size(); ++i) {
            if(int64_t(lines[i].length()) <= width) {
                CHECK(int64_t(padded[i].length()) == width);
            }
            CHECK(split_to_words(padded[i]) == split_to_words(lines[i]));
        }
        CHECK(padded.back() == lines.back());

        CHECK(lines_of(justify_text(words, width)) == lines);
    }
}

void test_justifier() {
    test_empty_input();
    test_single_letter();
    test_exact_fit();
    test_reference_paragraph();
    test_oversized_word();
    test_oversized_word_in_middle();
    test_invalid_width();
    test_huge_width();
    test_malformed_words();
    test_last_line_is_free();
    test_tie_prefers_longer_first_line();
    test_line_badness();
    test_greedy();
    test_padding();
    test_random_against_brute_force();
}

void test_utils() {
    test_utf8_widths();
    test_split_to_words();
    test_read_words();
}

int main(int, char **) {
    printf("Running text utility tests.\n");
    test_utils();
    printf("Running justifier tests.\n");
    test_justifier();
}
