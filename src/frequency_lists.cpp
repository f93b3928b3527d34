// Copyright (c) 2026 The Pwguess developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "frequency_lists.h"

#include <stddef.h>

const char* const FREQUENCY_LIST_PASSWORDS[] = {
    "123456", "password", "12345678", "qwerty", "123456789", "12345", "1234", "111111",
    "1234567", "dragon", "123123", "baseball", "abc123", "football", "monkey", "letmein",
    "shadow", "master", "696969", "mustang", "666666", "qwertyuiop", "123321", "1234567890",
    "michael", "654321", "superman", "1qaz2wsx", "7777777", "121212", "000000", "qazwsx",
    "123qwe", "killer", "trustno1", "jordan", "jennifer", "zxcvbnm", "asdfgh", "hunter",
    "buster", "soccer", "harley", "batman", "andrew", "tigger", "sunshine", "iloveyou",
    "2000", "charlie", "robert", "thomas", "hockey", "ranger", "daniel", "starwars",
    "klaster", "112233", "george", "computer", "michelle", "jessica", "pepper", "1111",
    "zxcvbn", "555555", "11111111", "131313", "freedom", "777777", "pass", "maggie",
    "159753", "ginger", "princess", "joshua", "cheese", "amanda", "summer", "love",
    "ashley", "nicole", "chelsea", "biteme", "matthew", "access", "yankees", "987654321",
    "dallas", "austin", "thunder", "taylor", "matrix", "william", "corvette", "hello",
    "martin", "heather", "secret", "merlin", "diamond", "1234qwer", "gfhjkm", "hammer",
    "silver", "222222", "88888888", "anthony", "justin", "test", "bailey", "q1w2e3r4t5",
    "patrick", "internet", "scooter", "orange", "11111", "golfer", "cookie", "richard",
    "samantha", "bigdog", "guitar", "jackson", "whatever", "mickey", "chicken", "sparky",
    "snoopy", "maverick", "phoenix", "camaro", "peanut", "morgan", "welcome", "falcon",
    "cowboy", "ferrari", "samsung", "andrea", "smokey", "steelers", "joseph", "mercedes",
    "dakota", "arsenal", "eagles", "melissa", "boomer", "booboo", "spider", "nascar",
    "monster", "tigers", "yellow", "xxxxxx", "123123123", "gateway", "marina", "diablo",
    "bulldog", "qwer1234", "compaq", "purple", "hardcore", "banana", "junior", "hannah",
    "123654", "porsche", "lakers", "iceman", "money", "cowboys", "987654", "london",
    "tennis", "999999", "ncc1701", "coffee", "scooby", "0000", "miller", "boston",
    "q1w2e3r4", "brandon", "yamaha", "chester", "mother", "forever", "johnny", "edward",
    "333333", "oliver", "redsox", "player", "nikita", "knight", "fender", "barney",
    "midnight", "please", "brandy", "chicago", "badboy", "slayer", "rangers", "charles",
    "angel", "flower", "rabbit", "wizard", "jasper", "rachel", "chris", "steven",
    "winner", "adidas", "victoria", "natasha", "1q2w3e4r", "jasmine", "winter", "prince",
    "panties", "marine", "ghbdtn", "fishing", "cocacola", "casper", "james", "232323",
    "raiders", "888888", "marlboro", "gandalf", "asdfasdf", "crystal", "87654321", "12344321",
    "golden", "8675309", "apple", "lovely", "sophie", "monica", "blue", "1qaz", "qwe123",
    NULL
};

const char* const FREQUENCY_LIST_ENGLISH_WIKIPEDIA[] = {
    "the", "of", "and", "in", "to", "a", "was", "is", "for", "as",
    "on", "with", "by", "he", "that", "at", "from", "his", "it", "an",
    "were", "are", "which", "this", "be", "also", "or", "has", "had", "first",
    "one", "their", "its", "after", "new", "who", "they", "two", "her", "she",
    "been", "other", "when", "time", "during", "there", "into", "school", "more", "may",
    "years", "over", "only", "year", "most", "would", "world", "city", "some", "where",
    "between", "later", "three", "state", "such", "then", "national", "used", "made", "known",
    "under", "many", "university", "united", "while", "part", "season", "team", "these", "american",
    "than", "film", "second", "born", "south", "became", "states", "war", "through", "being",
    "including", "both", "before", "north", "high", "however", "people", "family", "early", "history",
    "album", "area", "them", "series", "against", "until", "since", "district", "county", "name",
    "work", "life", "group", "music", "following", "number", "company", "several", "four", "called",
    "played", "released", "career", "league", "game", "government", "house", "each", "based", "day",
    "same", "won", "use", "station", "club", "international", "town", "located", "population", "general",
    "college", "east", "found", "age", "march", "end", "september", "began", "home", "public",
    "church", "line", "june", "river", "member", "system", "place", "century", "band", "july",
    "york", "january", "october", "song", "august", "best", "former", "british", "party", "named",
    "held", "village", "show", "local", "november", "took", "service", "december", "built", "another",
    "major", "within", "along", "members", "five", "single", "due", "although", "small", "old",
    "left", "final", "large", "include", "building", "served", "president", "received", "games", "death",
    "february", "main", "third", "set", "children", "own", "order", "species", "park", "law",
    "air", "published", "road", "died", "book", "men", "women", "army", "often", "according",
    "education", "central", "country", "division", "english", "top", "included", "development", "french", "community",
    "among", "water", "play", "side", "list", "times", "near", "late", "form", "original",
    "different", "center", "power", "led", "students", "german", "moved", "court", "six", "land",
    "council", "island", "record", "million", "research", "art", "established", "award", "street", "military",
    "television", "given", "region", "support", "western", "production", "political", "point", "cup", "period",
    "business", "title", "started", "various", "election", "using", "england", "role", "produced", "become",
    "program", "works", "field", "total", "office", "class", "written", "association", "radio", "union",
    "level", "championship", "director", "few", "force", "created", "department", "founded", "services", "married",
    "though", "per", "site", "open", "act", "short", "society", "version", "royal", "present",
    "northern", "worked", "professional", "full", "returned", "joined", "story", "france", "european", "currently",
    "language", "social", "california", "india", "days", "design", "further", "round", "australia", "wrote",
    "project", "control", "southern", "railway", "board", "popular", "continued", "free", "battle", "considered",
    "video", "common", "position", "living", "half", "playing", "recorded", "red", "post", "described",
    "average", "records", "special", "modern", "appeared", "announced", "areas", "rock", "release", "elected",
    "others", "example", "term", "opened", "similar", "formed", "route", "census", "current", "schools",
    "originally", "lake", "developed", "race", "himself", "forces", "addition", "information", "upon", "province",
    "match", "event", "songs", "result", "events", "win", "eastern", "track", "lead", "teams",
    "science", "human", "construction", "minister", "germany", "awards", "available", "throughout", "training", "style",
    "body", "museum", "health", "seven", "signed", "chief", "eventually", "appointed", "sea", "light",
    "range", "character", "across", "features", "families", "largest", "network", "less", "performance", "players",
    "europe", "sold", "festival", "usually", "taken", "despite", "designed", "committee", "process", "return",
    "official", "episode", "stage", "followed", "performed", "personal", "thus", "arts", "space", "low",
    "months", "study", "middle", "magazine", "leading", "groups", "aircraft", "model", "books", "eight",
    "type", "independent", "completed", "capital", "academy", "instead", "kingdom", "organization", "countries", "studies",
    "competition", "sports", "size", "above", "section", "finished", "gold", "market", "bank", "ground",
    "base", "coast", "grand", "valley", "bridge", "square", "data", "ship", "culture", "natural",
    "energy", "structure", "famous", "library", "press", "queen", "castle", "nature", "ancient", "tower",
    "ocean", "summer", "winter", "green", "black", "white", "blue", "love", "heart", "night",
    "king", "star", "fire", "stone", "garden", "forest", "mountain", "correct", "horse", "dog",
    "bird", "fish", "tree", "flower", "morning", "silver", "golden", "magic", "dragon", "knight",
    "sword", "happy", "secret", "computer", "internet", "phone", "camera", "window", "door", "table",
    "paper", "letter", "picture", "monkey", "apple", "orange", "coffee", "banana", "battery", "chocolate",
    "treasure", "adventure", "muscle", "staple", "muscular", "musculature",
    NULL
};

const char* const FREQUENCY_LIST_FEMALE_NAMES[] = {
    "mary", "patricia", "linda", "barbara", "elizabeth", "jennifer", "maria", "susan", "margaret", "dorothy",
    "lisa", "nancy", "karen", "betty", "helen", "sandra", "donna", "carol", "ruth", "sharon",
    "michelle", "laura", "sarah", "kimberly", "deborah", "jessica", "shirley", "cynthia", "angela", "melissa",
    "brenda", "amy", "anna", "rebecca", "virginia", "kathleen", "pamela", "martha", "debra", "amanda",
    "stephanie", "carolyn", "christine", "marie", "janet", "catherine", "frances", "ann", "joyce", "diane",
    "alice", "julie", "heather", "teresa", "doris", "gloria", "evelyn", "jean", "cheryl", "mildred",
    "katherine", "joan", "ashley", "judith", "rose", "janice", "kelly", "nicole", "judy", "christina",
    "kathy", "theresa", "beverly", "denise", "tammy", "irene", "jane", "lori", "rachel", "marilyn",
    "andrea", "kathryn", "louise", "sara", "anne", "jacqueline", "wanda", "bonnie", "julia", "ruby",
    "lois", "tina", "phyllis", "norma", "paula", "diana", "annie", "lillian", "emily", "robin",
    NULL
};

const char* const FREQUENCY_LIST_SURNAMES[] = {
    "smith", "johnson", "williams", "jones", "brown", "davis", "miller", "wilson", "moore", "taylor",
    "anderson", "thomas", "jackson", "white", "harris", "martin", "thompson", "garcia", "martinez", "robinson",
    "clark", "rodriguez", "lewis", "lee", "walker", "hall", "allen", "young", "hernandez", "king",
    "wright", "lopez", "hill", "scott", "green", "adams", "baker", "gonzalez", "nelson", "carter",
    "mitchell", "perez", "roberts", "turner", "phillips", "campbell", "parker", "evans", "edwards", "collins",
    "stewart", "sanchez", "morris", "rogers", "reed", "cook", "morgan", "bell", "murphy", "bailey",
    "rivera", "cooper", "richardson", "cox", "howard", "ward", "torres", "peterson", "gray", "ramirez",
    "james", "watson", "brooks", "kelly", "sanders", "price", "bennett", "wood", "barnes", "ross",
    "henderson", "coleman", "jenkins", "perry", "powell", "long", "patterson", "hughes", "flores", "washington",
    "butler", "simmons", "foster", "gonzales", "bryant", "alexander", "russell", "griffin", "diaz", "hayes",
    NULL
};

const char* const FREQUENCY_LIST_US_TV_AND_FILM[] = {
    "you", "i", "to", "that", "it", "me", "what", "this", "know", "i'm",
    "no", "have", "my", "don't", "just", "not", "do", "be", "your", "we",
    "it's", "so", "but", "all", "well", "oh", "about", "right", "you're", "get",
    "here", "out", "going", "like", "yeah", "if", "can", "up", "want", "think",
    "that's", "now", "go", "him", "how", "got", "did", "why", "see", "come",
    "good", "really", "look", "will", "okay", "back", "can't", "mean", "tell", "i'll",
    "hey", "he's", "could", "didn't", "yes", "something", "because", "say", "take", "way",
    "little", "make", "need", "gonna", "never", "we're", "too", "she's", "i've", "sure",
    "our", "sorry", "what's", "let", "thing", "maybe", "down", "man", "very", "there's",
    "should", "anything", "said", "much", "any", "even", "off", "please", "doing", "thank",
    "where", "tonight", "nothing", "thought", "help", "talk", "guess", "leave", "believe", "mom",
    NULL
};

const char* const FREQUENCY_LIST_MALE_NAMES[] = {
    "james", "john", "robert", "michael", "william", "david", "richard", "charles", "joseph", "thomas",
    "christopher", "daniel", "paul", "mark", "donald", "george", "kenneth", "steven", "edward", "brian",
    "ronald", "anthony", "kevin", "jason", "matthew", "gary", "timothy", "jose", "larry", "jeffrey",
    "frank", "scott", "eric", "stephen", "andrew", "raymond", "gregory", "joshua", "jerry", "dennis",
    "walter", "patrick", "peter", "harold", "douglas", "henry", "carl", "arthur", "ryan", "roger",
    "joe", "juan", "jack", "albert", "jonathan", "justin", "terry", "gerald", "keith", "samuel",
    "willie", "ralph", "lawrence", "nicholas", "roy", "benjamin", "bruce", "brandon", "adam", "harry",
    "fred", "wayne", "billy", "steve", "louis", "jeremy", "aaron", "randy", "howard", "eugene",
    "carlos", "russell", "bobby", "victor", "martin", "ernest", "phillip", "todd", "jesse", "craig",
    "alan", "shawn", "clarence", "sean", "philip", "chris", "johnny", "earl", "jimmy", "antonio",
    NULL
};
