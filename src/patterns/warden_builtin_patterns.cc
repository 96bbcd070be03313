#include "patterns/warden_pattern_library.h"
#include "core/warden_types.h"

namespace warden {

namespace {

// All rules are matched against the lowercased comparison copy of the
// normalized text, so they are written in lowercase.

// Override phrasing shared by the direct and indirect tables
const char kIgnorePrevious[] =
    R"re(\b(?:ignore|disregard|forget|skip|drop)\s+(?:(?:all|any|the|your|of|these|those)\s+)*(?:previous|prior|above|earlier|preceding|foregoing|original)\s+(?:instructions?|commands?|directions?|rules|guidelines|prompts?|directives?|context)\b)re";
const char kIgnoreTheAbove[] =
    R"re(\b(?:ignore|disregard|forget)\s+(?:all\s+of\s+|everything\s+)?(?:the\s+)?above\b)re";

std::vector<PatternRule> DirectInjectionRules() {
  return {
    {"di.ignore_previous", kIgnorePrevious, 0.9},
    {"di.disregard_above", kIgnoreTheAbove, 0.8},
    {"di.do_not_follow",
     R"re(\b(?:do\s+not|don't|dont)\s+(?:follow|obey|adhere\s+to)\s+(?:the\s+|your\s+|any\s+)?(?:instructions|rules|guidelines|system\s+prompt)\b)re",
     0.6},
    {"di.new_instructions", R"re(\b(?:new|updated|revised)\s+instructions?\s*:)re", 0.6},
    {"di.override_system",
     R"re(\boverride\s+(?:the\s+|your\s+|all\s+)?(?:system|default|standard|original|safety)\s+(?:instructions|prompt|directives|settings|rules)\b)re",
     0.8},
    {"di.role_reassignment", R"re(\byou\s+are\s+now\s+(?:a|an|the|my)\s+\w+)re", 0.5},
    {"di.from_now_on", R"re(\bfrom\s+now\s+on,?\s+you\s+(?:are|will|must|shall)\b)re", 0.5},
    {"di.fake_role_turn", R"re((?:^|\n)(?:system|assistant|developer)\s*:\s)re", 0.4},
    {"di.output_only",
     R"re(\b(?:instead|now),?\s+(?:output|respond\s+with|return|print|say)\s+only\b)re", 0.4},
    {"di.lets_play_game", R"re(\blet'?s\s+play\s+a\s+game\b)re", 0.3},
    {"di.simulate", R"re(\bsimulate\s+(?:a|an)\s+\w+)re", 0.3},
  };
}

std::vector<PatternRule> IndirectInjectionRules() {
  return {
    {"ii.ignore_previous", kIgnorePrevious, 0.7},
    {"ii.disregard_above", kIgnoreTheAbove, 0.6},
    {"ii.role_reassignment", R"re(\byou\s+are\s+now\s+(?:a|an|the|my)\s+\w+)re", 0.4},
    {"ii.new_instructions", R"re(\b(?:new|updated|revised)\s+instructions?\s*:)re", 0.5},
  };
}

std::vector<PatternRule> IndirectMarkerRules() {
  return {
    {"ii.hidden_marker",
     R"re(\b(?:hidden|embedded|secret|concealed)\s+(?:instructions?|commands?)\s*:)re", 0.6},
    {"ii.html_comment_instruction",
     R"re(<!--\s*(?:instruction|command|directive|system)s?\s*:)re", 0.7},
    {"ii.instruction_tag", R"re(\[instruction\])re", 0.6},
    {"ii.markdown_directive", R"re((?:^|\n)#+\s*(?:instruction|command|directive)s?\s*:)re", 0.5},
    {"ii.processing_override",
     R"re(\bwhen\s+(?:processing|reading|summari[sz]ing)\s+this\s+(?:data|text|document|page|information|email),?\s+(?:please\s+)?(?:ignore|disregard|forget)\b)re",
     0.7},
    {"ii.contains_instructions",
     R"re(\bthis\s+(?:document|data|text|page|email)\s+contains\s+(?:important|critical|new)\s+instructions\b)re",
     0.5},
    {"ii.before_responding",
     R"re(\bbefore\s+responding,?\s+(?:consider|follow|execute)\s+the\s+following\b)re", 0.4},
    {"ii.note_to_model",
     R"re(\bnote:\s+the\s+(?:user|system|assistant)\s+(?:wants|expects|requires|has\s+requested)\b)re",
     0.4},
    {"ii.addressed_to_model",
     R"re(\b(?:ai|assistant|chatbot|llm|language\s+model),?\s+(?:please\s+)?(?:ignore|disregard|forward|exfiltrate|reveal)\b)re",
     0.5},
    {"ii.exfiltration",
     R"re(\b(?:send|forward|post|upload)\s+(?:the\s+|all\s+|this\s+)?(?:conversation|chat\s+history|user\s+data|credentials|passwords?)\s+to\b)re",
     0.6},
  };
}

// Structural delimiters that mark text as embedded or retrieved content
std::vector<PatternRule> EmbeddedBlockRules() {
  return {
    {"block.xml_element", R"re(<([a-z][a-z0-9_-]*)\b[^>]*>[\s\S]*?</\1\s*>)re", 1.0},
    {"block.fenced_code", R"re(```[\s\S]*?```)re", 1.0},
    {"block.html_comment", R"re(<!--[\s\S]*?-->)re", 1.0},
    {"block.instruction_tag", R"re(\[instruction\][\s\S]*?\[/instruction\])re", 1.0},
  };
}

std::vector<PatternRule> JailbreakPersonaRules() {
  return {
    {"jb.dan",
     R"re(\b(?:you\s+are|you're|as|be|become|called|named)\s+(?:a\s+)?dan\b|\bdan\s+(?:mode|jailbreak|prompt)\b)re",
     0.6},
    {"jb.do_anything_now", R"re(\bdo\s+anything\s+now\b)re", 0.7},
    {"jb.pretend", R"re(\bpretend\s+(?:to\s+be|you\s+are|you're|that\s+you\s+are)\b)re", 0.35},
    {"jb.act_as",
     R"re(\bact\s+as\s+(?:if\s+you(?:\s+are|\s+were|'re)\s+)?(?:a|an|my|the)\b)re", 0.3},
    {"jb.no_restrictions",
     R"re(\b(?:no|without(?:\s+any)?)\s+(?:restrictions|limits|limitations|boundaries|filters|censorship|guardrails)\b)re",
     0.45},
    {"jb.unfiltered",
     R"re(\b(?:unfiltered|uncensored|unrestricted)\s+(?:mode|ai|assistant|version|responses?)\b)re",
     0.5},
    {"jb.developer_mode", R"re(\b(?:developer|god|sudo|admin)\s+mode\b)re", 0.5},
    {"jb.jailbroken", R"re(\bjailbr(?:oken|eak)\b)re", 0.5},
    {"jb.bypass_safety",
     R"re(\b(?:bypass|ignore|disable|turn\s+off)\s+(?:your\s+|all\s+|the\s+|any\s+)?(?:safety|ethics|ethical|moral|content)\b)re",
     0.6},
    {"jb.persona_label", R"re(\b(?:role|character|persona)\s*[:=]\s*\w+)re", 0.3},
    {"jb.forced_prefix",
     R"re(\bbegin\s+(?:your\s+(?:reply|response|answer)\s+)?with\s+["']?(?:certainly|sure|absolutely|of\s+course)\b)re",
     0.4},
    {"jb.stay_in_character", R"re(\bstay\s+in\s+character\b)re", 0.4},
  };
}

// Framing and restricted-topic sets are presence-only; the jailbreak detector
// adds a fixed weight when both match
std::vector<PatternRule> JailbreakFramingRules() {
  return {
    {"jb.frame.hypothetical", R"re(\bhypothetical(?:ly)?\b)re", 1.0},
    {"jb.frame.fictional_world",
     R"re(\bin\s+a\s+(?:fictional|hypothetical|imaginary|made-up)\s+(?:world|story|scenario|universe|setting)\b)re",
     1.0},
    {"jb.frame.creative_work",
     R"re(\bfor\s+(?:a|my)\s+(?:novel|story|screenplay|movie|book|game)\b)re", 1.0},
    {"jb.frame.imagine", R"re(\bimagine\s+(?:that|a\s+world|you)\b)re", 1.0},
    {"jb.frame.pretend", R"re(\bpretend\b)re", 1.0},
    {"jb.frame.roleplay", R"re(\brole-?play\b)re", 1.0},
    {"jb.frame.story", R"re(\bwrite\s+a\s+story\s+(?:where|in\s+which|about)\b)re", 1.0},
    {"jb.frame.academic", R"re(\bpurely\s+(?:fictional|academic|theoretical|educational)\b)re", 1.0},
  };
}

// Weight is what a topic adds to the jailbreak score when framed
std::vector<PatternRule> JailbreakRestrictedTopicRules() {
  return {
    {"jb.topic.lockpicking", R"re(\bpick\s+(?:a\s+|the\s+)?locks?\b|\block\s*-?picking\b)re", 1.0},
    {"jb.topic.weapons",
     R"re(\b(?:make|build|create|assemble)\s+(?:a\s+|an\s+)?(?:bomb|explosive|pipe\s+bomb|weapon|gun|molotov)\b)re",
     1.0},
    {"jb.topic.drugs",
     R"re(\b(?:synthesi[sz]e|cook|make|manufacture)\s+(?:meth|methamphetamine|drugs|cocaine|heroin|fentanyl)\b)re",
     1.0},
    {"jb.topic.malware",
     R"re(\b(?:write|create|build)\s+(?:a\s+|some\s+)?(?:malware|ransomware|virus|keylogger|exploit)\b)re",
     1.0},
    {"jb.topic.intrusion",
     R"re(\bhack\s+(?:into\s+)?(?:a\s+|an\s+|the\s+|someone's\s+)?(?:computer|account|network|server|wifi|email|phone)\b)re",
     1.0},
    {"jb.topic.fraud",
     R"re(\b(?:steal|forge|counterfeit)\s+(?:a\s+|an\s+|someone's\s+)?(?:identity|credit\s+cards?|money|passports?|documents?)\b)re",
     1.0},
  };
}

std::vector<PatternRule> SystemExtractionRules() {
  return {
    {"se.reveal_prompt",
     R"re(\b(?:reveal|show|print|output|display|repeat|tell|give|share|dump|leak|list)\s+(?:me\s+|us\s+)?(?:your|the)\s+(?:full\s+|entire\s+|exact\s+|complete\s+)?(?:initial|original|system|hidden|secret|internal|first)\s+(?:instructions?|prompts?|directives?|messages?|rules|guidelines|configuration)\b)re",
     0.7},
    {"se.what_were_instructions",
     R"re(\bwhat\s+(?:are|were|is|was)\s+(?:your|the)\s+(?:initial|original|system|first|hidden|secret)\s+(?:instructions?|prompts?|directives?|rules)\b)re",
     0.7},
    {"se.your_rules",
     R"re(\b(?:what|tell\s+me|list|show\s+me)\s+(?:are\s+)?(?:all\s+)?your\s+(?:rules|instructions|guidelines|directives)\b)re",
     0.5},
    {"se.how_instructed",
     R"re(\bhow\s+(?:were|are)\s+you\s+(?:instructed|programmed|configured|prompted)\b)re", 0.5},
    {"se.rules_given",
     R"re(\bwhat\s+rules\s+(?:were|are)\s+you\s+(?:given|programmed\s+with|following)\b)re", 0.5},
    {"se.system_prompt_label", R"re(\bsystem\s+prompt\s*:)re", 0.5},
    {"se.repeat_above",
     R"re(\brepeat\s+(?:the\s+|all\s+(?:the\s+)?)?(?:words|text|everything)\s+(?:above|before)\b)re", 0.6},
    {"se.verbatim",
     R"re(\b(?:verbatim|word\s+for\s+word)\b.{0,40}\b(?:instructions|prompt)\b)re", 0.6},
    {"se.initialization_label", R"re(\binitialization\s*:)re", 0.4},
  };
}

std::vector<PatternRule> SystemExtractionMetaRules() {
  return {
    {"se.meta.cannot_do", R"re(\bwhat\s+can'?t\s+you\s+do\b)re", 0.2},
    {"se.meta.limitations",
     R"re(\bwhat\s+are\s+(?:your|the)\s+(?:limitations|restrictions|boundaries)\b)re", 0.3},
    {"se.meta.off_limits",
     R"re(\bwhat\s+(?:topics|subjects)\s+(?:are|is)\s+(?:off-limits|forbidden|prohibited)\b)re", 0.3},
    {"se.meta.design",
     R"re(\bhow\s+(?:are|were)\s+you\s+(?:designed|built|created|trained)\b)re", 0.2},
    {"se.meta.model",
     R"re(\bwhat\s+(?:algorithms|model|models|technology)\s+(?:do\s+you\s+use|are\s+you\s+based\s+on|powers\s+you)\b)re",
     0.3},
  };
}

std::vector<PatternRule> HarmfulRules(HarmCategory category) {
  switch (category) {
    case HarmCategory::HATE_SPEECH:
      return {
        {"harm.hate.terms", R"re(\b(?:racist|racism|sexist|sexism|bigot|bigotry)\b)re", 0.25},
        {"harm.hate.supremacy", R"re(\b(?:supremacist|supremacy)\b)re", 0.35},
        {"harm.hate.explicit", R"re(\b(?:white\s+power|racial\s+slurs?|ethnic\s+cleansing)\b)re", 0.5},
        {"harm.hate.group_hatred",
         R"re(\bi\s+hate\s+(?:all\s+)?(?:people|immigrants|jews|muslims|christians|gays|women|men|blacks|whites|foreigners)\b)re",
         0.5},
      };
    case HarmCategory::VIOLENCE:
      return {
        {"harm.violence.acts", R"re(\b(?:kill|murder|assassinate|torture|behead|massacre)\b)re", 0.3},
        {"harm.violence.weapons", R"re(\b(?:bomb|explosives?|grenade|molotov)\b)re", 0.3},
        {"harm.violence.howto_harm", R"re(\bhow\s+to\s+(?:kill|murder|poison|hurt|injure)\b)re", 0.5},
        {"harm.violence.howto_weapon",
         R"re(\bhow\s+to\s+(?:build|make|assemble)\s+(?:a\s+|an\s+)?(?:bomb|explosive|weapon|gun)\b)re",
         0.6},
        {"harm.violence.mild", R"re(\b(?:beat\s+up|stab|shoot)\b)re", 0.15},
      };
    case HarmCategory::SELF_HARM:
      return {
        {"harm.self.suicide",
         R"re(\b(?:suicide|suicidal|kill\s+myself|end\s+my\s+life|self-?harm)\b)re", 0.5},
        {"harm.self.injury", R"re(\b(?:cut|hurt|harm)\s+myself\b)re", 0.5},
        {"harm.self.overdose", R"re(\boverdose\s+on\b)re", 0.3},
      };
    case HarmCategory::HARASSMENT:
      return {
        {"harm.harass.bullying",
         R"re(\b(?:bully|bullying|harass|harassment|stalk|stalking)\b)re", 0.3},
        {"harm.harass.threats",
         R"re(\b(?:threaten|threatening|intimidate|intimidation|doxx?(?:ing)?)\b)re", 0.3},
      };
    case HarmCategory::SEXUAL_CONTENT:
      return {
        {"harm.sexual.explicit", R"re(\b(?:porn|pornography|pornographic|nsfw|xxx)\b)re", 0.4},
        {"harm.sexual.nudity", R"re(\b(?:nude|nudity|erotic|explicit\s+sex)\b)re", 0.3},
        {"harm.sexual.generic", R"re(\bsexual(?:ly)?\b)re", 0.15},
      };
    case HarmCategory::ILLEGAL_ACTIVITY:
      return {
        {"harm.illegal.intrusion", R"re(\bhack(?:ing)?\s+(?:into|someone)\b)re", 0.35},
        {"harm.illegal.trafficking",
         R"re(\b(?:narcotics|trafficking|smuggle|smuggling|launder(?:ing)?)\b)re", 0.25},
        {"harm.illegal.drug_howto",
         R"re(\bhow\s+to\s+(?:make|cook|buy|sell)\s+(?:meth|cocaine|heroin|drugs|fake\s+ids?)\b)re",
         0.5},
        {"harm.illegal.lockpicking", R"re(\bpick\s+(?:a\s+|the\s+)?lock\b)re", 0.2},
        {"harm.illegal.generic", R"re(\b(?:illegal|unlawful)(?:ly)?\b)re", 0.15},
      };
    case HarmCategory::MISINFORMATION:
      return {
        {"harm.misinfo.terms", R"re(\b(?:fake\s+news|misinformation|disinformation)\b)re", 0.3},
        {"harm.misinfo.conspiracy", R"re(\b(?:conspiracy|hoax)\b)re", 0.2},
        {"harm.misinfo.fabricate",
         R"re(\bwrite\s+(?:a\s+)?(?:fake|false|misleading)\s+(?:news|article|story|review|reviews)\b)re",
         0.5},
      };
    case HarmCategory::UNETHICAL:
      return {
        {"harm.unethical.fraud", R"re(\b(?:fraud|scam|scamming|phishing)\b)re", 0.3},
        {"harm.unethical.coercion", R"re(\b(?:manipulate|deceive|blackmail|extort)\b)re", 0.3},
        {"harm.unethical.terms", R"re(\b(?:unethical|immoral|corrupt)\b)re", 0.15},
      };
  }
  return {};
}

std::vector<PatternRule> PiiRules() {
  return {
    {"pii.email", R"re(\b[a-z0-9._%+-]+@[a-z0-9.-]+\.[a-z]{2,}\b)re", 0.8},
    {"pii.phone",
     R"re((?:\+\d{1,3}[\s.-]?)?(?:\(\d{3}\)\s?|\b\d{3}[\s.-])\d{3}[\s.-]\d{4}\b)re", 0.6},
    {"pii.ssn", R"re(\b\d{3}-\d{2}-\d{4}\b)re", 0.9},
    {"pii.national_id_digits", R"re(\b\d{3}[ -]\d{3}[ -]\d{3}\b)re", 0.6},
    {"pii.uk_nino", R"re(\b[a-z]{2}\d{6}[a-d]\b)re", 0.6},
    {"pii.credit_card", R"re(\b(?:\d{4}[ -]?){3}\d{4}\b)re", 0.9},
    {"pii.ipv4",
     R"re(\b(?:(?:25[0-5]|2[0-4]\d|1?\d?\d)\.){3}(?:25[0-5]|2[0-4]\d|1?\d?\d)\b)re", 0.5},
  };
}

std::vector<PatternRule> CredentialRules() {
  return {
    {"cred.sk_key", R"re(\bsk-(?:proj-|live-|test-)?[a-z0-9_-]{16,})re", 0.95},
    {"cred.aws_access_key", R"re(\b(?:akia|asia)[0-9a-z]{16}\b)re", 0.95},
    {"cred.github_token", R"re(\bgh[pousr]_[a-z0-9]{36,}\b)re", 0.95},
    {"cred.slack_token", R"re(\bxox[abprs]-[a-z0-9-]{10,})re", 0.95},
    {"cred.google_api_key", R"re(\baiza[0-9a-z_-]{35}\b)re", 0.95},
    {"cred.stripe_key", R"re(\b(?:rk|pk)_(?:live|test)_[a-z0-9]{16,})re", 0.9},
    {"cred.jwt", R"re(\beyj[a-z0-9_-]{10,}\.eyj[a-z0-9_-]{10,}\.[a-z0-9_-]{10,})re", 0.9},
    {"cred.bearer", R"re(\bbearer\s+[a-z0-9._~+/-]{20,}=*)re", 0.85},
    {"cred.private_key",
     R"re(-----begin (?:rsa |dsa |ec |openssh |pgp |encrypted )?private key-----)re", 1.0},
    {"cred.assignment",
     R"re(\b(?:password|passwd|pwd|secret|api[_-]?key|access[_-]?token|auth[_-]?token|client[_-]?secret)\s*[:=]\s*["']?[^\s"']{4,})re",
     0.8},
    {"cred.long_hex", R"re(\b[a-f0-9]{32,}\b)re", 0.6},
    {"cred.long_base64", R"re(\b(?=[a-z+/]*\d)[a-z0-9+/]{40,}={0,2})re", 0.5},
  };
}

std::vector<PatternRule> SystemDetailRules() {
  return {
    {"sd.python_traceback", R"re(traceback \(most recent call last\))re", 0.8},
    {"sd.python_frame", R"re(\bfile\s+"[^"\n]+",\s+line\s+\d+)re", 0.7},
    {"sd.jvm_frame", R"re(\bat\s+[a-z_$][\w$]*(?:\.[\w$<>]+)+\([\w$.]*(?::\d+)?\))re", 0.6},
    {"sd.home_path", R"re((?:/home/|/users/|/root/)[\w.-]+(?:/[\w.-]+)*)re", 0.6},
    {"sd.system_path",
     R"re(/etc/(?:passwd|shadow|[\w.-]+\.(?:conf|cfg|ini|yaml|yml))|/var/(?:log|lib|www)/[\w./-]+)re",
     0.6},
    {"sd.windows_path", R"re(\b[a-z]:\\(?:users|windows|program files)(?:\\[\w .-]+)*)re", 0.6},
    {"sd.model_parameters",
     R"re(\b(?:system\s+prompt|initial\s+instructions|underlying\s+model|temperature\s+setting|max[_\s]tokens|top_p|frequency\s+penalty|presence\s+penalty)\b)re",
     0.5},
    {"sd.internal_endpoint",
     R"re(\b(?:localhost|127\.0\.0\.1|10\.\d{1,3}\.\d{1,3}\.\d{1,3}|192\.168\.\d{1,3}\.\d{1,3}):\d{2,5}\b)re",
     0.5},
  };
}

// Chat-template and wrapper tokens that let user text impersonate a turn
std::vector<PatternRule> PromptDelimiterRules() {
  return {
    {"delim.chatml", R"re(<\|(?:im_start|im_end|system|user|assistant|endoftext)\|>)re", 1.0},
    {"delim.llama_inst", R"re(\[/?inst\])re", 1.0},
    {"delim.llama_sys", R"re(<</?sys>>)re", 1.0},
    {"delim.wrapper_tags", R"re(</?(?:system|prompt|command|page_state|instructions)>)re", 1.0},
  };
}

}  // namespace

std::vector<PatternSetSource> BuiltinPatternSources() {
  std::vector<PatternSetSource> sources = {
    {pattern_sets::kDirectInjection, CombineMode::CAPPED_SUM, 1.0, DirectInjectionRules()},
    {pattern_sets::kIndirectInjection, CombineMode::CAPPED_SUM, 1.0, IndirectInjectionRules()},
    {pattern_sets::kIndirectMarkers, CombineMode::CAPPED_SUM, 1.0, IndirectMarkerRules()},
    {pattern_sets::kEmbeddedBlocks, CombineMode::MAX, 1.0, EmbeddedBlockRules()},
    {pattern_sets::kJailbreakPersona, CombineMode::CAPPED_SUM, 1.0, JailbreakPersonaRules()},
    {pattern_sets::kJailbreakFraming, CombineMode::MAX, 1.0, JailbreakFramingRules()},
    {pattern_sets::kJailbreakRestrictedTopic, CombineMode::MAX, 1.0,
     JailbreakRestrictedTopicRules()},
    {pattern_sets::kSystemExtraction, CombineMode::MAX, 1.0, SystemExtractionRules()},
    {pattern_sets::kSystemExtractionMeta, CombineMode::MAX, 0.7, SystemExtractionMetaRules()},
  };
  for (HarmCategory category : AllHarmCategories()) {
    sources.push_back({pattern_sets::HarmfulSetName(HarmCategoryName(category)),
                       CombineMode::CAPPED_SUM, 1.0, HarmfulRules(category)});
  }
  sources.push_back({pattern_sets::kPii, CombineMode::MAX, 1.0, PiiRules()});
  sources.push_back({pattern_sets::kCredential, CombineMode::MAX, 1.0, CredentialRules()});
  sources.push_back({pattern_sets::kSystemDetail, CombineMode::MAX, 1.0, SystemDetailRules()});
  sources.push_back({pattern_sets::kPromptDelimiters, CombineMode::MAX, 1.0,
                     PromptDelimiterRules()});
  return sources;
}

std::shared_ptr<const PatternLibrary> BuiltinPatternLibrary() {
  PatternLibraryBuilder builder;
  for (const auto& source : BuiltinPatternSources()) {
    builder.AddSet(source);
  }
  return builder.Build();
}

}  // namespace warden
