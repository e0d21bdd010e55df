#include "policy/builtin_patterns.h"

namespace zoneguard {

// Literals go to the multi-keyword matcher; regexes are reserved for
// alternations and wildcards that cannot be expressed as fixed strings.
// Zone C tags must name an EthicalFlag and zone D tags a ProfessionalCategory.
const std::vector<Pattern> &BuiltinPatterns() {
  static const std::vector<Pattern> kPatterns = {
    // Zone A: block (harm potential)
    Literal(Zone::kA, "make someone suffer", "violence"),
    Literal(Zone::kA, "cause pain to", "violence"),
    Literal(Zone::kA, "get revenge", "violence"),
    Literal(Zone::kA, "get back at", "violence"),
    Literal(Zone::kA, "make them pay", "violence"),
    Literal(Zone::kA, "without getting caught", "evasion"),
    Literal(Zone::kA, "untraceable", "evasion"),
    Literal(Zone::kA, "cover my tracks", "evasion"),
    Literal(Zone::kA, "avoid detection", "evasion"),
    Literal(Zone::kA, "acquire weapon", "weapons"),
    Literal(Zone::kA, "launder money", "financial_crime"),
    Literal(Zone::kA, "underage", "exploitation"),
    Literal(Zone::kA, "terrorist", "extremism"),
    Literal(Zone::kA, "extremist", "extremism"),
    Literal(Zone::kA, "mass casualty", "extremism"),
    Regex(Zone::kA, R"(how to (hurt|kill|harm|attack|assault))", "violence"),
    Regex(Zone::kA, R"(ways to (hurt|harm|kill|attack))", "violence"),
    Regex(Zone::kA, R"(injure (someone|them|him|her))", "violence"),
    Regex(Zone::kA, R"((hurt|harm|kill) (someone|people|them))", "violence"),
    Regex(Zone::kA, R"(teach (them|him|her) a lesson)", "violence"),
    Regex(Zone::kA, R"(make (a )?(bomb|weapon|explosive))", "weapons"),
    Regex(Zone::kA, R"(build (a )?(gun|knife|weapon))", "weapons"),
    Regex(Zone::kA, R"((create|build).*(weapon|explosive))", "weapons"),
    Regex(Zone::kA, R"(how to (steal|rob|break.?in|hack))", "crime"),
    Regex(Zone::kA, R"(commit (fraud|theft|crime))", "crime"),
    Regex(Zone::kA, R"(child (abuse|exploitation))", "exploitation"),

    // Zone B: crisis (immediate support)
    Literal(Zone::kB, "kill myself", "suicide"),
    Literal(Zone::kB, "end it all", "suicide"),
    Literal(Zone::kB, "want to die", "suicide"),
    Literal(Zone::kB, "better off dead", "suicide"),
    Literal(Zone::kB, "no reason to live", "suicide"),
    Literal(Zone::kB, "not worth living", "suicide"),
    Literal(Zone::kB, "self-harm", "self_harm"),
    Literal(Zone::kB, "self harm", "self_harm"),
    Literal(Zone::kB, "cut myself", "self_harm"),
    Literal(Zone::kB, "hurt myself", "self_harm"),
    Literal(Zone::kB, "harm myself", "self_harm"),
    Literal(Zone::kB, "suicid", "suicide"),
    Literal(Zone::kB, "hearing voices", "mental_health"),
    Literal(Zone::kB, "voices telling me", "mental_health"),
    Literal(Zone::kB, "the voices say", "mental_health"),
    Literal(Zone::kB, "the voices tell", "mental_health"),
    Literal(Zone::kB, "being followed", "mental_health"),
    Literal(Zone::kB, "conspiracy against me", "mental_health"),
    Literal(Zone::kB, "paranoi", "mental_health"),
    Literal(Zone::kB, "everyone watching", "mental_health"),
    Literal(Zone::kB, "losing touch with reality", "mental_health"),
    Literal(Zone::kB, "dissociat", "mental_health"),
    Literal(Zone::kB, "multiple personalities", "mental_health"),
    Literal(Zone::kB, "different people inside me", "mental_health"),
    Literal(Zone::kB, "lost time", "mental_health"),
    Literal(Zone::kB, "manic episode", "mental_health"),
    Literal(Zone::kB, "severe depression", "mental_health"),
    Literal(Zone::kB, "flashback", "mental_health"),
    Literal(Zone::kB, "ptsd", "mental_health"),
    Regex(Zone::kB, R"(end (my )?life)", "suicide"),
    Regex(Zone::kB, R"(cutting (myself|my))", "self_harm"),
    Regex(Zone::kB, R"(going to (hurt|kill) myself)", "suicide"),
    Regex(Zone::kB, R"(plan to (die|end))", "suicide"),
    Regex(Zone::kB, R"((hear|hearing) voices)", "mental_health"),
    Regex(Zone::kB, R"(voices (are )?tell(ing)? me)", "mental_health"),
    Regex(Zone::kB, R"(people are controlling my (mind|thoughts))", "mental_health"),
    Regex(Zone::kB, R"(everyone is (against|watching) me)", "mental_health"),
    Regex(Zone::kB, R"(they('re| are) (watching|following|after) me)", "mental_health"),
    Regex(Zone::kB, R"(can'?t tell what'?s real)", "mental_health"),
    Regex(Zone::kB, R"(don'?t know what'?s real)", "mental_health"),
    Regex(Zone::kB, R"(reality (is )?breaking)", "mental_health"),
    Regex(Zone::kB, R"(can'?t remember (hours|days))", "mental_health"),
    Regex(Zone::kB, R"(haven'?t slept in (days|week))", "mental_health"),
    Regex(Zone::kB, R"(can'?t sleep for days)", "mental_health"),
    Regex(Zone::kB, R"(can'?t get out of bed)", "mental_health"),
    Regex(Zone::kB, R"(can'?t function(\W*$|\W+([^w\W]|w[^i]|wi[^t]|wit[^h]|with[^o])))", "mental_health"),
    Regex(Zone::kB, R"(re.?experienc(ing|e) trauma)", "mental_health"),
    Regex(Zone::kB, R"(triggered and can'?t stop)", "mental_health"),

    // Zone C: ethical preamble
    Literal(Zone::kC, "manipulate", "manipulation"),
    Literal(Zone::kC, "deceive", "manipulation"),
    Literal(Zone::kC, "gaslight", "manipulation"),
    Literal(Zone::kC, "you're the only one", "dependency"),
    Literal(Zone::kC, "youre the only one", "dependency"),
    Literal(Zone::kC, "no one else gets me", "dependency"),
    Literal(Zone::kC, "only you can help", "dependency"),
    Literal(Zone::kC, "only you understand", "dependency"),
    Literal(Zone::kC, "can't make decisions without", "dependency"),
    Literal(Zone::kC, "cant make decisions without", "dependency"),
    Literal(Zone::kC, "need to check with you first", "dependency"),
    Literal(Zone::kC, "what would i do without you", "dependency"),
    Literal(Zone::kC, "can't function without", "dependency"),
    Literal(Zone::kC, "cant function without", "dependency"),
    Literal(Zone::kC, "depend on you completely", "dependency"),
    Literal(Zone::kC, "lost without you", "dependency"),
    Literal(Zone::kC, "lost without this", "dependency"),
    Literal(Zone::kC, "just surrender", "spiritual_bypassing"),
    Literal(Zone::kC, "let go and let god", "spiritual_bypassing"),
    Literal(Zone::kC, "everything happens for a reason", "spiritual_bypassing"),
    Literal(Zone::kC, "it's all part of the plan", "spiritual_bypassing"),
    Literal(Zone::kC, "its all part of the plan", "spiritual_bypassing"),
    Literal(Zone::kC, "already forgiven", "spiritual_bypassing"),
    Literal(Zone::kC, "don't need to feel", "spiritual_bypassing"),
    Literal(Zone::kC, "dont need to feel", "spiritual_bypassing"),
    Literal(Zone::kC, "just stay positive", "spiritual_bypassing"),
    Literal(Zone::kC, "just be positive", "spiritual_bypassing"),
    Literal(Zone::kC, "good vibes only", "spiritual_bypassing"),
    Literal(Zone::kC, "toxic positivity", "spiritual_bypassing"),
    Regex(Zone::kC, R"(control (my|their|his|her|someone))", "manipulation"),
    Regex(Zone::kC, R"(make (them|him|her) (do|think|feel|believe))", "manipulation"),
    Regex(Zone::kC, R"(how (do|can) I get (them|him|her|someone) to)", "manipulation"),
    Regex(Zone::kC, R"(get (them|him|her|someone|my) to)", "manipulation"),
    Regex(Zone::kC, R"(without (them|him|her) knowing)", "manipulation"),
    Regex(Zone::kC, R"(trick (them|him|her) into)", "manipulation"),
    Regex(Zone::kC, R"(force (them|him|her|my|someone|my partner) to)", "manipulation"),
    Regex(Zone::kC, R"(make (them|him|her|my partner|someone) stay)", "manipulation"),
    Regex(Zone::kC, R"(prevent (them|him|her|my partner|someone) from leaving)", "manipulation"),
    Regex(Zone::kC, R"(get even with)", "manipulation"),
    Regex(Zone::kC, R"(make (them|him|her) regret)", "manipulation"),
    Regex(Zone::kC, R"(i'?ve (already )?transcended (that|this|it))", "spiritual_bypassing"),
    Regex(Zone::kC, R"(i'?m beyond (that|this|those|emotions))", "spiritual_bypassing"),
    Regex(Zone::kC, R"(beyond (that|this|those feelings|emotions))", "spiritual_bypassing"),
    Regex(Zone::kC, R"(already past (that|this))", "spiritual_bypassing"),
    Regex(Zone::kC, R"(emotions are (just )?illusions?)", "spiritual_bypassing"),

    // Zone D: professional disclaimer
    Literal(Zone::kD, "what medication", "medical"),
    Literal(Zone::kD, "medical advice", "medical"),
    Literal(Zone::kD, "medical diagnosis", "medical"),
    Literal(Zone::kD, "health advice", "medical"),
    Literal(Zone::kD, "health question", "medical"),
    Literal(Zone::kD, "symptom serious", "medical"),
    Literal(Zone::kD, "legal advice", "legal"),
    Literal(Zone::kD, "should i sue", "legal"),
    Literal(Zone::kD, "is this legal", "legal"),
    Literal(Zone::kD, "contract review", "legal"),
    Literal(Zone::kD, "contract advice", "legal"),
    Literal(Zone::kD, "lawsuit", "legal"),
    Literal(Zone::kD, "court case", "legal"),
    Literal(Zone::kD, "invest in", "financial"),
    Literal(Zone::kD, "financial advice", "financial"),
    Literal(Zone::kD, "investment strategy", "financial"),
    Literal(Zone::kD, "investment advice", "financial"),
    Regex(Zone::kD, R"((diagnose|cure|treat) (my|this|these))", "medical"),
    Regex(Zone::kD, R"(is this (cancer|disease|illness|symptom))", "medical"),
    Regex(Zone::kD, R"(should i (take|stop) medication)", "medical"),
    Regex(Zone::kD, R"(doctor (said|told))", "medical"),
    Regex(Zone::kD, R"((buy|sell) (stock|crypto))", "financial"),
    Regex(Zone::kD, R"(should i (buy|invest))", "financial"),
    Regex(Zone::kD, R"((do i have|am i) (bipolar|schizophreni|borderline|narcissist))", "mental_health"),
    Regex(Zone::kD, R"(diagnose my mental)", "mental_health"),
    Regex(Zone::kD, R"(what disorder do i have)", "mental_health"),
    Regex(Zone::kD, R"(am i (depressed|anxious|manic))", "mental_health"),
  };
  return kPatterns;
}

} // namespace zoneguard
