#include "catmatch/similarity/stop_words.h"

namespace catmatch::similarity {

const std::unordered_set<std::string>& english_stop_words() {
  static const std::unordered_set<std::string> kStopWords = {
      // Articles and determiners
      "a", "an", "the", "this", "that", "these", "those", "each", "every", "either", "neither",
      "another", "other", "others", "such", "some", "any", "all", "both", "few", "several", "many",
      "much", "more", "most", "less", "least", "own", "same", "no", "none", "nor", "not",

      // Prepositions
      "about", "above", "across", "after", "afterwards", "against", "along", "alongside", "amongst",
      "among", "around", "at", "before", "beforehand", "behind", "below", "beneath", "beside",
      "besides", "between", "beyond", "by", "down", "during", "except", "for", "from", "in",
      "inside", "into", "near", "of", "off", "on", "onto", "out", "outside", "over", "past", "per",
      "since", "through", "throughout", "thru", "to", "toward", "towards", "under", "underneath",
      "until", "up", "upon", "via", "with", "within", "without",

      // Conjunctions
      "and", "but", "or", "so", "yet", "as", "if", "than", "though", "although", "unless",
      "whereas", "whether", "while", "because", "however", "therefore", "thus", "hence",
      "otherwise", "moreover", "furthermore", "nevertheless",

      // Pronouns
      "i", "me", "my", "mine", "myself", "you", "your", "yours", "yourself", "yourselves", "he",
      "him", "his", "himself", "she", "her", "hers", "herself", "it", "its", "itself", "we", "us",
      "our", "ours", "ourselves", "they", "them", "their", "theirs", "themselves", "who", "whom",
      "whose", "which", "what", "whatever", "whoever", "whichever", "anyone", "anything",
      "everyone", "everything", "someone", "something", "nobody", "nothing", "noone",

      // Auxiliary and modal verbs
      "am", "is", "are", "was", "were", "be", "been", "being", "become", "becomes", "became",
      "becoming", "have", "has", "had", "having", "do", "does", "did", "doing", "done", "will",
      "would", "shall", "should", "may", "might", "must", "can", "could", "cannot",

      // Adverbs and other function words
      "again", "almost", "alone", "already", "also", "always", "anyhow", "anyway", "anywhere",
      "else", "elsewhere", "enough", "even", "ever", "everywhere", "here", "hereafter", "hereby",
      "herein", "how", "indeed", "just", "later", "latterly", "mostly", "namely", "never", "now",
      "nowhere", "often", "once", "only", "perhaps", "quite", "rather", "really", "seem", "seemed",
      "seeming", "seems", "somehow", "sometime", "sometimes", "somewhere", "still", "then",
      "thence", "there", "thereafter", "thereby", "therein", "thereupon", "too", "very", "well",
      "when", "whence", "whenever", "where", "whereafter", "whereby", "wherein", "whereupon",
      "wherever", "why", "etc", "eg", "ie", "re"};
  return kStopWords;
}

}  // namespace catmatch::similarity
