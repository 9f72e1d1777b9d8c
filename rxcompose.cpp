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

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <limits>
#include <set>
#include <string>
#include <vector>
#include <re2/re2.h>
#include "rxcompose.h"

namespace RxCompose {

typedef std::int32_t WChar;
constexpr WChar WCharMax = 0x10FFFF;
constexpr int RepeatMax = 1000;		// RE2's limit on any counted repetition bound

const char *
errmsg(ErrorCode code)
{
	static const char *const messages[] = {
		"success",
		"invalid repetition bounds",
		"repetition count too large",
		"invalid range endpoint",
		"empty character class",
		"invalid character class name",
		"invalid trailing backslash",
		"invalid UTF-8 text",
		"empty capture name",
		"duplicate capture name",
		"rendered pattern rejected by engine",
		"pattern too large",
		"unknown capture name",
		"capture ordinal out of range",
		"unknown error code",
	};
	auto i = static_cast<std::size_t>(code);
	if (i > static_cast<std::size_t>(ErrorCode::Unknown))
		i = static_cast<std::size_t>(ErrorCode::Unknown);
	return messages[i];
}

Error::Error(ErrorCode code, const std::string &detail)
: std::runtime_error(detail.empty() ? std::string(errmsg(code)) : std::string(errmsg(code)) + ": " + detail)
, ecode(code)
{}

// Decodes UTF-8 one code point at a time.  Bytes that do not begin a valid
// sequence are consumed singly and returned as Bad + byte, which is negative.
class U8Conv final {
public:
	enum { End = -1 };
	static constexpr WChar Bad = std::numeric_limits<WChar>::min();
private:
	const char *const bp;
	const char *const ep;
	const char *cp;
public:
	U8Conv(std::string_view s): bp(s.data()), ep(s.data() + s.size()), cp(s.data()) {}
	WChar nextchr() {
		static constexpr WChar least[] = { 0, 0x80, 0x800, 0x10000 };
		if (cp == ep)
			return End;
		WChar u = (unsigned char) *cp;
		if (u < 0x80)
			return ++cp, u;
		int n = (u & 0xE0) == 0xC0 ? 1 : (u & 0xF0) == 0xE0 ? 2 : (u & 0xF8) == 0xF0 ? 3 : 0;
		if (n == 0 || ep - cp <= n)
			return ++cp, Bad + u;
		WChar r = u & (0x3F >> n);
		for (int i = 1; i <= n; ++i) {
			WChar v = (unsigned char) cp[i];
			if ((v & 0xC0) != 0x80)
				return ++cp, Bad + u;
			r = (r << 6) | (v & 0x3F);
		}
		if (r < least[n] || r > WCharMax || (r >= 0xD800 && r <= 0xDFFF))
			return ++cp, Bad + u;
		return cp += n + 1, r;
	}
	std::size_t off() const { return cp - bp; }
	auto ptr() const { return cp; }
	void restore(const char *p) { cp = p; }
};

struct CSet {
	struct Range {
		WChar min, max;
		int operator<=>(const Range &r) const {
			return (min > r.max) - (max < r.min);
		}
	};
	std::set<Range> ranges;
	CSet &set(WChar wclo, WChar wchi) {
		// probe one wider on each side so adjacent ranges coalesce too
		auto [x, y] = ranges.equal_range(Range { wclo - (wclo > 0), wchi + (wchi < WCharMax) });
		if (x != y) {
			wclo = std::min(wclo, x->min);
			wchi = std::max(wchi, std::prev(y)->max);
			ranges.erase(x, y);
		}
		ranges.insert(Range { wclo, wchi });
		return *this;
	}
	CSet &set(WChar wc) { return set(wc, wc); }
	bool cclass(std::string_view name) {
		static const struct { std::string_view name, bounds; } cclasses[] = {
			{ "alnum",  "09AZaz" },
			{ "alpha",  "AZaz" },
			{ "blank",  "\t\t  " },
			{ "cntrl",  std::string_view("\0\x1f\x7f\x7f", 4) },
			{ "digit",  "09" },
			{ "graph",  "!~" },
			{ "lower",  "az" },
			{ "print",  " ~" },
			{ "punct",  "!/:@[`{~" },
			{ "space",  "\t\r  " },
			{ "upper",  "AZ" },
			{ "word",   "09AZ__az" },
			{ "xdigit", "09AFaf" },
		};
		for (const auto &c : cclasses)
			if (c.name == name) {
				for (std::size_t i = 0; i + 1 < c.bounds.size(); i += 2)
					set((unsigned char) c.bounds[i], (unsigned char) c.bounds[i + 1]);
				return true;
			}
		return false;
	}
	// Members as written between brackets, without the brackets themselves.
	ErrorCode parse(std::string_view spec) {
		auto unescape = [](WChar wc) -> WChar {
			switch (wc) {
			case L'f': return L'\f';
			case L'n': return L'\n';
			case L'r': return L'\r';
			case L't': return L'\t';
			case L'v': return L'\v';
			default:   return wc;
			}
		};
		U8Conv conv(spec);
		auto wc = conv.nextchr();
		while (wc != U8Conv::End) {
			auto wclo = wc, wchi = wc;
			wc = conv.nextchr();
			if (wclo == L'\\') {
				if (wc == U8Conv::End)
					return ErrorCode::BadEscape;
				wclo = wchi = unescape(wc);
				wc = conv.nextchr();
			} else if (wclo == L'[' && wc == L':') {
				auto bp = conv.ptr(), ep = bp;
				do
					ep = conv.ptr(), wc = conv.nextchr();
				while (wc != U8Conv::End && wc != L':');
				if (wc != L':' || conv.nextchr() != L']')
					return ErrorCode::BadClassName;
				if (!cclass(std::string_view(bp, ep - bp)))
					return ErrorCode::BadClassName;
				wc = conv.nextchr();
				continue;
			}
			if (wc == L'-') {
				auto save = conv.ptr();
				wc = conv.nextchr();
				if (wc == U8Conv::End) {
					conv.restore(save);
					wc = L'-';
				} else {
					wchi = wc;
					wc = conv.nextchr();
					if (wchi == L'\\') {
						if (wc == U8Conv::End)
							return ErrorCode::BadEscape;
						wchi = unescape(wc);
						wc = conv.nextchr();
					} else if (wchi == L'[' && wc == L':') {
						return ErrorCode::BadRange; // can't be range endpoint
					}
				}
			}
			if (wclo < 0 || wchi < 0)
				return ErrorCode::BadText;
			if (wclo > wchi)
				return ErrorCode::BadRange;
			set(wclo, wchi);
		}
		return ranges.empty() ? ErrorCode::EmptyClass : ErrorCode::Success;
	}
};

struct Node {
	Expr::Kind type;
	std::string text;			// Literal: UTF-8 text
	std::size_t nchr = 0;			// Literal: length in characters
	CSet cset;				// CharClass
	bool negated = false;			// CharClass
	AnchorKind anchor = AnchorKind::Start;	// Anchor
	int min = 0, max = 0;			// Repetition
	bool greedy = true;			// Repetition
	bool capturing = false;			// Group
	std::optional<std::string> name;	// Group
	std::vector<Expr> kids;
};

const Node &Expr::node() const { return *root; }
Expr::Kind Expr::kind() const { return root->type; }
std::size_t Expr::size() const { return root->kids.size(); }
std::string Expr::str() const { return render(*this).text; }

static Expr
mk(Node &&n)
{
	return Expr(std::make_shared<const Node>(std::move(n)));
}

Expr
literal(std::string_view text)
{
	Node n { Expr::Literal };
	U8Conv conv(text);
	for (WChar wc; (wc = conv.nextchr()) != U8Conv::End; ++n.nchr)
		if (wc < 0)
			throw ConfigError(ErrorCode::BadText, "literal byte " + std::to_string(conv.off() - 1));
	n.text = text;
	return mk(std::move(n));
}

Expr
charClass(std::string_view spec, bool negate)
{
	Node n { Expr::CharClass };
	if (auto err = n.cset.parse(spec); err != ErrorCode::Success)
		throw ConfigError(err, "\"" + std::string(spec) + "\"");
	n.negated = negate;
	return mk(std::move(n));
}

Expr
any()
{
	return mk(Node { Expr::AnyChar });
}

Expr
anchor(AnchorKind kind)
{
	Node n { Expr::Anchor };
	n.anchor = kind;
	return mk(std::move(n));
}

static Expr
join(Expr::Kind type, const Expr &a, const Expr &b)
{
	Node n { type };
	for (const Expr *e : { &a, &b })
		if (e->kind() == type)
			n.kids.insert(n.kids.end(), e->node().kids.begin(), e->node().kids.end());
		else
			n.kids.push_back(*e);
	return mk(std::move(n));
}

Expr concat(const Expr &a, const Expr &b) { return join(Expr::Sequence, a, b); }
Expr altern(const Expr &a, const Expr &b) { return join(Expr::Alternation, a, b); }

// Repetitions rendered with {} rather than * + ?
static bool
counted(const Node &n)
{
	return !((n.min == 0 || n.min == 1) && n.max == Unbounded) && !(n.min == 0 && n.max == 1);
}

// RE2 divides its repetition limit by each counted bound on the way down a
// tree and rejects the pattern if the quotient reaches zero on any path.
static bool
fits(const Node &n, int limit)
{
	if (n.type == Expr::Repetition && counted(n)) {
		int m = n.max != Unbounded ? n.max : n.min;
		if (m > 0 && (limit /= m) == 0)
			return false;
	}
	for (const auto &k : n.kids)
		if (!fits(k.node(), limit))
			return false;
	return true;
}

Expr
repeat(const Expr &e, int min, int max, bool greedy)
{
	auto bounds = [&]() {
		return "{" + std::to_string(min) + "," + (max == Unbounded ? std::string() : std::to_string(max)) + "}";
	};
	if (min < 0 || (max != Unbounded && (max < 0 || min > max)))
		throw ConfigError(ErrorCode::BadRepeat, bounds());
	if (min > RepeatMax || max > RepeatMax)
		throw ConfigError(ErrorCode::RepeatSize, bounds());
	Node n { Expr::Repetition };
	n.min = min;
	n.max = max;
	n.greedy = greedy;
	n.kids.push_back(e);
	if (!fits(n, RepeatMax))
		throw ConfigError(ErrorCode::RepeatSize, "nested " + bounds());
	return mk(std::move(n));
}

Expr many(const Expr &e, bool greedy) { return repeat(e, 0, Unbounded, greedy); }
Expr oneOrMore(const Expr &e, bool greedy) { return repeat(e, 1, Unbounded, greedy); }
Expr optional(const Expr &e, bool greedy) { return repeat(e, 0, 1, greedy); }

Expr
capture(const Expr &e)
{
	Node n { Expr::Group };
	n.capturing = true;
	n.kids.push_back(e);
	return mk(std::move(n));
}

Expr
capture(const Expr &e, std::string_view name)
{
	if (name.empty())
		throw ConfigError(ErrorCode::BadName, "");
	Node n { Expr::Group };
	n.capturing = true;
	n.name = std::string(name);
	n.kids.push_back(e);
	return mk(std::move(n));
}

Expr
group(const Expr &e)
{
	Node n { Expr::Group };
	n.kids.push_back(e);
	return mk(std::move(n));
}

Expr
all(const Expr &e)
{
	return concat(anchor(AnchorKind::Start), e, anchor(AnchorKind::End));
}

Expr digit() { return charClass("[:digit:]"); }
Expr nonDigit() { return charClass("[:digit:]", true); }
Expr space() { return charClass("[:space:]"); }
Expr nonSpace() { return charClass("[:space:]", true); }
Expr word() { return charClass("[:word:]"); }
Expr nonWord() { return charClass("[:word:]", true); }
Expr alpha() { return charClass("[:alpha:]"); }
Expr alnum() { return charClass("[:alnum:]"); }
Expr upper() { return charClass("[:upper:]"); }
Expr lower() { return charClass("[:lower:]"); }
Expr xdigit() { return charClass("[:xdigit:]"); }
Expr punct() { return charClass("[:punct:]"); }

std::optional<std::size_t>
NameRegistry::find(std::string_view name) const
{
	if (auto i = index.find(name); i != index.end())
		return i->second;
	return std::nullopt;
}

std::size_t
NameRegistry::ordinal(std::string_view name) const
{
	if (auto i = index.find(name); i != index.end())
		return i->second;
	throw LookupError(ErrorCode::NoName, std::string(name));
}

// Emits one tree depth-first, left to right.  Capture ordinals are assigned
// as each opening parenthesis is written, which is the order RE2 numbers
// groups in.
struct Render {
	enum Prec { AltP, CatP, RepP, AtomP };
	Rendered r;
	std::string &out = r.text;
	static Prec prec(const Node &n) {
		switch (n.type) {
		case Expr::Literal:
			return n.nchr == 1 ? AtomP : CatP;
		case Expr::Sequence:
			return CatP;
		case Expr::Alternation:
			return AltP;
		case Expr::Repetition:
			return RepP;
		default:
			return AtomP;
		}
	}
	void hex(WChar wc) {
		char buf[16];
		std::snprintf(buf, sizeof buf, "\\x{%x}", (unsigned) wc);
		out += buf;
	}
	void member(WChar wc) {
		if (wc < 0x80 && std::isalnum(wc))
			out += (char) wc;
		else
			hex(wc);
	}
	void sub(const Node &n, bool wrap) {
		if (wrap)
			out += "(?:";
		node(n);
		if (wrap)
			out += ')';
	}
	void node(const Node &n) {
		switch (n.type) {
		case Expr::Literal:
			{
				U8Conv conv(n.text);
				for (WChar wc; (wc = conv.nextchr()) != U8Conv::End; )
					if (wc >= 0x20 && wc < 0x7F) {
						if (std::strchr("\\.+*?()|[]{}^$", wc))
							out += '\\';
						out += (char) wc;
					} else {
						hex(wc);
					}
			}
			break;
		case Expr::CharClass:
			out += n.negated ? "[^" : "[";
			for (const auto &e : n.cset.ranges) {
				member(e.min);
				if (e.max > e.min + 1)
					out += '-';
				if (e.max > e.min)
					member(e.max);
			}
			out += ']';
			break;
		case Expr::AnyChar:
			out += '.';
			break;
		case Expr::Anchor:
			out += n.anchor == AnchorKind::Start ? '^' : '$';
			break;
		case Expr::Sequence:
			for (const auto &k : n.kids)
				sub(k.node(), prec(k.node()) < CatP);
			break;
		case Expr::Alternation:
			for (std::size_t i = 0; i < n.kids.size(); ++i) {
				if (i != 0)
					out += '|';
				sub(n.kids[i].node(), prec(n.kids[i].node()) < AltP);
			}
			break;
		case Expr::Repetition:
			{
				const Node &k = n.kids[0].node();
				sub(k, prec(k) < AtomP);
				if (!counted(n)) {
					out += n.min == 1 ? '+' : n.max == 1 ? '?' : '*';
				} else {
					out += '{' + std::to_string(n.min);
					if (n.max != n.min) {
						out += ',';
						if (n.max != Unbounded)
							out += std::to_string(n.max);
					}
					out += '}';
				}
				if (!n.greedy)
					out += '?';
			}
			break;
		case Expr::Group:
			if (n.capturing) {
				auto ordinal = ++r.names.ngroups;
				if (n.name) {
					if (!r.names.index.emplace(*n.name, ordinal).second)
						throw ConfigError(ErrorCode::DupName, *n.name);
					r.names.entries.emplace_back(*n.name, ordinal);
				}
				out += '(';
			} else {
				out += "(?:";
			}
			sub(n.kids[0].node(), false);
			out += ')';
			break;
		}
	}
};

Rendered
render(const Expr &e)
{
	Render rd;
	rd.node(e.node());
	return std::move(rd.r);
}

Pattern::Pattern(Rendered &&r, std::unique_ptr<re2::RE2> re, unsigned cflags)
: text(std::move(r.text))
, registry(std::move(r.names))
, re(std::move(re))
, cflags(cflags)
{}

Pattern::Pattern(Pattern &&) = default;
Pattern &Pattern::operator=(Pattern &&) = default;
Pattern::~Pattern() = default;

Pattern
compile(const Expr &e, unsigned flags)
{
	auto r = render(e);
	re2::RE2::Options opt;
	opt.set_log_errors(false);
	opt.set_case_sensitive((flags & ICase) == 0);
	opt.set_dot_nl((flags & DotNL) != 0);
	opt.set_longest_match((flags & Longest) != 0);
	auto re = std::make_unique<re2::RE2>(re2::StringPiece(r.text.data(), r.text.size()), opt);
	if (!re->ok())
		throw CompileError(re->error_code() == re2::RE2::ErrorPatternTooLarge ? ErrorCode::PatternSize : ErrorCode::BadPattern,
				   "/" + r.text + "/: " + re->error());
	if ((std::size_t) re->NumberOfCapturingGroups() != r.names.groups())
		throw CompileError(ErrorCode::BadPattern, "/" + r.text + "/: engine counts " + std::to_string(re->NumberOfCapturingGroups())
				   + " groups, renderer " + std::to_string(r.names.groups()));
	return Pattern(std::move(r), std::move(re), flags);
}

struct Execute {
	static std::optional<Result> run(const Pattern &p, std::string_view text, std::size_t pos, re2::RE2::Anchor anchor) {
		// RE2 cannot tell an empty group from an absent one in a null text
		static const char empty[] = "";
		if (text.data() == nullptr)
			text = std::string_view(empty, 0);
		if (pos > text.size())
			return std::nullopt;
		auto nsub = p.names().groups() + 1;
		std::vector<re2::StringPiece> sub(nsub);
		if (!p.native().Match(re2::StringPiece(text.data(), text.size()), pos, text.size(), anchor, sub.data(), (int) nsub))
			return std::nullopt;
		Result res(p, text);
		res.spans.reserve(nsub);
		for (const auto &s : sub)
			if (s.data() != nullptr) {
				std::size_t so = s.data() - text.data();
				res.spans.push_back(Span { so, so + s.size() });
			} else {
				res.spans.push_back(std::nullopt);
			}
		return res;
	}
};

std::optional<Result>
match(const Pattern &p, std::string_view text)
{
	return Execute::run(p, text, 0, re2::RE2::ANCHOR_START);
}

std::optional<Result>
fullMatch(const Pattern &p, std::string_view text)
{
	return Execute::run(p, text, 0, re2::RE2::ANCHOR_BOTH);
}

std::optional<Result>
search(const Pattern &p, std::string_view text, std::size_t pos)
{
	return Execute::run(p, text, pos, re2::RE2::UNANCHORED);
}

std::optional<Span>
Result::rangeFor(std::size_t ordinal) const
{
	if (ordinal >= spans.size())
		throw LookupError(ErrorCode::NoOrdinal, std::to_string(ordinal));
	return spans[ordinal];
}

std::optional<Span>
Result::rangeFor(std::string_view name) const
{
	return rangeFor(pat->names().ordinal(name));
}

std::optional<std::string_view>
Result::get(std::size_t ordinal) const
{
	if (auto sp = rangeFor(ordinal))
		return subject.substr(sp->begin, sp->size());
	return std::nullopt;
}

std::optional<std::string_view>
Result::get(std::string_view name) const
{
	return get(pat->names().ordinal(name));
}

MatchIterator::MatchIterator(const Pattern &p, std::string_view text)
: pat(&p)
, subject(text)
{
	++*this;
}

MatchIterator &
MatchIterator::operator++()
{
	cur = search(*pat, subject, next);
	if (cur) {
		auto sp = *cur->rangeFor(std::size_t(0));
		next = sp.end;
		if (sp.begin == sp.end) {
			// step over one whole character after an empty match
			if (sp.end == subject.size()) {
				next = sp.end + 1;
			} else {
				U8Conv conv(subject.substr(sp.end));
				conv.nextchr();
				next = sp.end + conv.off();
			}
		}
	}
	return *this;
}

bool
MatchIterator::operator==(const MatchIterator &mi) const
{
	if (!cur || !mi.cur)
		return !cur && !mi.cur;
	return pat == mi.pat && subject.data() == mi.subject.data() && next == mi.next;
}

MatchRange
allMatches(const Pattern &p, std::string_view text)
{
	return MatchRange(p, text);
}

const Pattern &
LazyPattern::get() const
{
	if (ready.load(std::memory_order_acquire))
		return *pat;
	std::lock_guard<std::mutex> lock(mutex);
	if (!pat) {
		pat.emplace(compile(expr, cflags));
		ready.store(true, std::memory_order_release);
	}
	return *pat;
}

}
