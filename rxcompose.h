//
// RxCompose: composable regular expressions rendered for RE2.
// Copyright (C) 2026 The RxCompose Authors.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions
// are met:
//
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
//
// THIS SOFTWARE IS PROVIDED BY THE AUTHOR AND CONTRIBUTORS “AS IS” AND
// ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE AUTHOR OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS
// OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION)
// HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
// LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY
// OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF
// SUCH DAMAGE.
//

#ifndef _RXCOMPOSE_H
#define _RXCOMPOSE_H

#include <atomic>
#include <cstddef>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace re2 { class RE2; }

namespace RxCompose {

enum class ErrorCode {			/* Carried by every RxCompose::Error */
	Success = 0,
	BadRepeat,			/* repeat(): min < 0, max < min, or negative max other than Unbounded */
	RepeatSize,			/* repeat(): bound, or product of nested bounds, exceeds engine limit */
	BadRange,			/* charClass(): range endpoints reversed or not single characters */
	EmptyClass,			/* charClass(): no members */
	BadClassName,			/* charClass(): unknown [:name:] */
	BadEscape,			/* charClass(): trailing backslash */
	BadText,			/* literal() or charClass(): text is not valid UTF-8 */
	BadName,			/* capture(): empty group name */
	DupName,			/* compile(): two capturing groups share a name */
	BadPattern,			/* compile(): engine rejected the rendered pattern */
	PatternSize,			/* compile(): engine memory budget exceeded */
	NoName,				/* Result/NameRegistry: name not registered */
	NoOrdinal,			/* Result: ordinal beyond the pattern's group count */
	Unknown
};

const char *errmsg(ErrorCode);

class Error : public std::runtime_error {
public:
	Error(ErrorCode code, const std::string &detail);
	ErrorCode code() const { return ecode; }
private:
	ErrorCode ecode;
};

/* Invalid combinator arguments; raised before any tree is built from the call */
class ConfigError : public Error {
public:
	using Error::Error;
};

/* Engine rejected a rendered pattern; indicates a renderer bug or a resource limit */
class CompileError : public Error {
public:
	using Error::Error;
};

/* Result or registry access by an unregistered name or out-of-range ordinal */
class LookupError : public Error {
public:
	using Error::Error;
};

enum CompileFlags : unsigned {		/* Flags for compile() */
	ICase = 1,			/* ignore case */
	DotNL = 2,			/* any() also matches \n */
	Longest = 4			/* leftmost-longest rather than leftmost-first */
};

enum class AnchorKind { Start, End };

constexpr int Unbounded = -1;		/* upper bound for repeat() meaning no limit */

struct Node;

/*
 * Immutable pattern expression.  Copies share structure; combinators always
 * build new nodes, so a sub-expression may appear in any number of trees.
 */
class Expr {
public:
	enum Kind { Literal, CharClass, AnyChar, Anchor, Sequence, Alternation, Repetition, Group };
	Kind kind() const;
	std::size_t size() const;	/* number of direct children */
	std::string str() const;	/* rendered native syntax */
	const Node &node() const;
	explicit Expr(std::shared_ptr<const Node> root): root(std::move(root)) {}
private:
	std::shared_ptr<const Node> root;
};

Expr literal(std::string_view text);
Expr charClass(std::string_view spec, bool negate = false);
Expr any();
Expr anchor(AnchorKind kind);
Expr concat(const Expr &a, const Expr &b);
Expr altern(const Expr &a, const Expr &b);
Expr repeat(const Expr &e, int min, int max, bool greedy = true);
Expr many(const Expr &e, bool greedy = true);
Expr oneOrMore(const Expr &e, bool greedy = true);
Expr optional(const Expr &e, bool greedy = true);
Expr capture(const Expr &e);
Expr capture(const Expr &e, std::string_view name);
Expr group(const Expr &e);
Expr all(const Expr &e);

template <typename... XArgs>
Expr concat(const Expr &a, const Expr &b, const Expr &c, const XArgs &... xargs) {
	return concat(concat(a, b), c, xargs...);
}

template <typename... XArgs>
Expr altern(const Expr &a, const Expr &b, const Expr &c, const XArgs &... xargs) {
	return altern(altern(a, b), c, xargs...);
}

/* Shorthand classes, ASCII semantics */
Expr digit();
Expr nonDigit();
Expr space();
Expr nonSpace();
Expr word();
Expr nonWord();
Expr alpha();
Expr alnum();
Expr upper();
Expr lower();
Expr xdigit();
Expr punct();

/* Capture names in the order the engine numbers their groups */
class NameRegistry {
public:
	typedef std::pair<std::string, std::size_t> Entry;
	std::optional<std::size_t> find(std::string_view name) const;
	std::size_t ordinal(std::string_view name) const;
	std::size_t groups() const { return ngroups; }
	std::size_t size() const { return entries.size(); }
	bool empty() const { return entries.empty(); }
	auto begin() const { return entries.begin(); }
	auto end() const { return entries.end(); }
private:
	friend struct Render;
	std::vector<Entry> entries;
	std::map<std::string, std::size_t, std::less<>> index;
	std::size_t ngroups = 0;
};

struct Rendered {
	std::string text;
	NameRegistry names;
};

Rendered render(const Expr &e);

class Pattern {
public:
	Pattern(Pattern &&);
	Pattern &operator=(Pattern &&);
	Pattern(const Pattern &) = delete;
	Pattern &operator=(const Pattern &) = delete;
	~Pattern();
	const std::string &str() const { return text; }
	const re2::RE2 &native() const { return *re; }
	const NameRegistry &names() const { return registry; }
	unsigned flags() const { return cflags; }
private:
	friend Pattern compile(const Expr &, unsigned);
	Pattern(Rendered &&r, std::unique_ptr<re2::RE2> re, unsigned cflags);
	std::string text;
	NameRegistry registry;
	std::unique_ptr<re2::RE2> re;
	unsigned cflags;
};

/* Render and compile; every call renders afresh, callers cache the result */
Pattern compile(const Expr &e, unsigned flags = 0);

struct Span {
	std::size_t begin;
	std::size_t end;
	std::size_t size() const { return end - begin; }
	bool operator==(const Span &) const = default;
};

/*
 * One match.  Refers to the Pattern that produced it and to the caller's
 * text; both must outlive the Result.
 */
class Result {
public:
	std::optional<std::string_view> get(std::string_view name) const;
	std::optional<std::string_view> get(std::size_t ordinal) const;
	std::optional<Span> rangeFor(std::string_view name) const;
	std::optional<Span> rangeFor(std::size_t ordinal) const;
	std::string_view fullText() const { return *get(std::size_t(0)); }
	std::size_t groups() const { return spans.size() - 1; }
	const Pattern &pattern() const { return *pat; }
	std::string_view text() const { return subject; }
private:
	friend struct Execute;
	Result(const Pattern &p, std::string_view text): pat(&p), subject(text) {}
	const Pattern *pat;
	std::string_view subject;
	std::vector<std::optional<Span>> spans;
};

std::optional<Result> match(const Pattern &p, std::string_view text);
std::optional<Result> fullMatch(const Pattern &p, std::string_view text);
std::optional<Result> search(const Pattern &p, std::string_view text, std::size_t pos = 0);

class MatchIterator {
public:
	typedef std::input_iterator_tag iterator_category;
	typedef Result value_type;
	typedef std::ptrdiff_t difference_type;
	typedef const Result *pointer;
	typedef const Result &reference;
	MatchIterator() = default;
	MatchIterator(const Pattern &p, std::string_view text);
	const Result &operator*() const { return *cur; }
	const Result *operator->() const { return &*cur; }
	MatchIterator &operator++();
	void operator++(int) { ++*this; }
	bool operator==(const MatchIterator &mi) const;
private:
	const Pattern *pat = nullptr;
	std::string_view subject;
	std::size_t next = 0;
	std::optional<Result> cur;
};

/* Non-overlapping matches left to right; begin() restarts the scan */
class MatchRange {
public:
	MatchRange(const Pattern &p, std::string_view text): pat(&p), subject(text) {}
	MatchIterator begin() const { return MatchIterator(*pat, subject); }
	MatchIterator end() const { return MatchIterator(); }
private:
	const Pattern *pat;
	std::string_view subject;
};

MatchRange allMatches(const Pattern &p, std::string_view text);

/*
 * Caller-owned compile-once slot.  Concurrent first calls compile exactly
 * once; a failed compile leaves the slot empty and the next call retries.
 * The library itself keeps no cache.
 */
class LazyPattern {
public:
	explicit LazyPattern(Expr e, unsigned flags = 0): expr(std::move(e)), cflags(flags) {}
	const Pattern &get() const;
	const Pattern &operator*() const { return get(); }
	const Pattern *operator->() const { return &get(); }
private:
	Expr expr;
	unsigned cflags;
	mutable std::atomic<bool> ready { false };
	mutable std::mutex mutex;
	mutable std::optional<Pattern> pat;
};

}

#endif /* _RXCOMPOSE_H */
